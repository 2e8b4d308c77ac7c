/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#include "file.h"
#include "ak_assert.h"
#include "strutil.h"
#include "util.h"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <utility>
#include <zlib.h>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
// On POSIX, get 64-bit versions of ftell and fseek by setting _FILE_OFFSET_BITS=64
#if !defined(_FILE_OFFSET_BITS) || (_FILE_OFFSET_BITS != 64)
#error Must define _FILE_OFFSET_BITS=64 project-wide
#endif

BEGIN_NAMESPACE_AK

bool is_file(const string& path)
{
	struct stat st;
	return stat(path.c_str(), &st) == 0 && !S_ISDIR(st.st_mode);
}

string prepend_dir(std::string_view dir, std::string_view filename)
{
	if (dir.empty())
		return string{filename};
	string ret{dir};
	if (!endswith(dir, "/"))
		ret += '/';
	ret += filename;
	return ret;
}

string dir_name(const string& path)
{
	auto slash = path.rfind('/');
	if (slash == string::npos)
		return ".";
	return slash == 0 ? string{"/"} : path.substr(0, slash);
}

string base_name(const string& path)
{
	auto slash = path.rfind('/');
	return slash == string::npos ? path : path.substr(slash + 1);
}

string default_tmp_dir()
{
	const char* dir = getenv("TMPDIR");
	return dir && *dir ? string{dir} : string{"/tmp"};
}

string make_temp_file(const string& dir, std::string_view prefix, std::string_view suffix)
{
	string path = prepend_dir(dir, prefix);
	path += "XXXXXX";
	path += suffix;
	int fd = mkstemps(path.data(), (int)suffix.size());
	AK_CHECK(fd >= 0, file, "Could not create temporary file in {} ({}).", dir, strerror(errno));
	::close(fd);
	return path;
}

bool remove_file(const string& path)
{
	return std::remove(path.c_str()) == 0;
}

bool rename_file(const string& from, const string& to)
{
	return std::rename(from.c_str(), to.c_str()) == 0;
}

string read_file_prefix(const string& path, size_t n)
{
	std::unique_ptr<std::FILE, decltype(&std::fclose)> fh{ std::fopen(path.c_str(), "rb"), &std::fclose };
	AK_CHECK(fh, file, "Could not open {} for reading ({}).", path, strerror(errno));
	string prefix(n, '\0');
	size_t got = std::fread(prefix.data(), 1, n, fh.get());
	AK_CHECK(got == n || !std::ferror(fh.get()), file, "I/O error reading {} ({}).", path, strerror(errno));
	prefix.resize(got);
	return prefix;
}

///////////////////////////////////////////////////////////////////////////////

void binary_file::open(const string& path, const char* mode)
{
	AK_CHECK(!is_open(), runtime, "Cannot open new file without closing old one.");
	string binmode(mode);
	if (binmode.find('b') == string::npos)
		binmode.push_back('b');
	_fh = { fopen(path.c_str(), binmode.c_str()), &fclose };
	AK_CHECK(_fh, file, "Could not open {} ({}).", path, strerror(errno));
	_path = path;
}

void binary_file::close()
{
	if (!_fh)
		return;
	// fclose reports write errors that were buffered, so it cannot go through the deleter
	std::FILE* fh = _fh.release();
	AK_CHECK(std::fclose(fh) == 0, file, "Error closing {} ({}).", _path, strerror(errno));
}

void binary_file::flush()
{
	AK_CHECK(std::fflush(_fh.get()) == 0, file, "Error flushing {} ({}).", _path, strerror(errno));
}

void binary_file::set_seek(size_t offset)
{
	int result = fseeko(_fh.get(), (off_t)offset, SEEK_SET);
	AK_CHECK(result == 0, file, "Error seeking to position {} in {} ({}).", offset, _path, strerror(errno));
}

long long binary_file::tell() const
{
	return (long long)ftello(_fh.get());
}

void binary_file::read(void* dst, size_t item_size, size_t num_items)
{
	if (num_items > 0) {
		size_t n = fread(dst, item_size, num_items, _fh.get());
		AK_CHECK(n == num_items, file, "Expected to read {} bytes from {}, but read {} bytes ({})",
				 item_size * num_items, _path, item_size * n, feof(_fh.get()) ? "end of file" : strerror(errno));
	}
}

void binary_file::write(const void* src, size_t item_size, size_t num_items)
{
	if (num_items > 0) {
		size_t n = fwrite(src, item_size, num_items, _fh.get());
		AK_CHECK(n == num_items, file, "Expected to write {} bytes to {}, but failed ({})",
				 item_size * num_items, _path, strerror(errno));
	}
}

void binary_file::write_str(std::string_view s)
{
	write(int_cast<uint32_t>(s.size()));
	write(s.data(), 1, s.size());
}

void binary_file::read_str(string& s)
{
	auto n = read<uint32_t>();
	s.resize(n);
	read(s.data(), 1, n);
}

void binary_file::write_checkpoint(unsigned magic) { write(magic); }

void binary_file::read_checkpoint(unsigned magic)
{
	auto actual = read<unsigned>();
	AK_CHECK(magic == actual, file, "File I/O checkpoint expected to be '{:x}' but found '{:x}' in {}.", magic, actual, _path);
}

///////////////////////////////////////////////////////////

const char* stdin_path = "-";

void line_reader::open(const char* path)
{
	_fh = strcmp(path, stdin_path) != 0 ? decltype(_fh){ std::fopen(path, "rb"), &std::fclose }
										: decltype(_fh){ stdin, [](auto) { return 0; } };
	AK_CHECK(_fh, file, "Could not open {} for reading ({}).", path, strerror(errno));
	advance();
}

bool line_reader::refill()
{
	constexpr size_t min_bufsize = (1 << 17);
	constexpr size_t max_bufsize = (1 << 26); // Something is wrong with a 64MB line.

	if (_eof)
		return false;

	// Move the partial line to the front of the buffer, growing it if the
	// partial line already fills the whole buffer.
	size_t partial = _end - _pos;
	if (_pos > 0 && partial > 0)
		std::memmove(_buf.data(), _buf.data() + _pos, partial);
	_pos = 0;
	_end = partial;
	if (_buf.size() < min_bufsize || partial == _buf.size()) {
		size_t new_size = std::max(min_bufsize, _buf.size() * 2);
		AK_CHECK(new_size <= max_bufsize, value, "Extremely long line encountered. Something wrong?");
		_buf.resize(new_size);
	}

	size_t nread = fread(_buf.data() + _end, _buf.size() - _end);
	if (nread == 0)
		_eof = true;
	_end += nread;
	return nread > 0;
}

void line_reader::advance()
{
	for (;;) {
		if (_pos < _end) {
			char* first = _buf.data() + _pos;
			char* last  = _buf.data() + _end;
			char* nl    = find_delim(first, last, '\n');
			if (nl != last) {
				_line = std::string_view(first, nl - first);
				_pos += (nl - first) + 1;
				break;
			}
		}
		if (!refill()) {
			if (_pos == _end) {
				// Nothing left, not even a line without a trailing newline
				_done = true;
				_line = {};
				return;
			}
			_line = std::string_view(_buf.data() + _pos, _end - _pos);
			_pos  = _end;
			break;
		}
	}
	if (!_line.empty() && _line.back() == '\r')
		_line.remove_suffix(1);
	_line_num++;
}

size_t line_reader::fread(char* dst, size_t bytes)
{
	size_t n = std::fread(dst, 1, bytes, _fh.get());
	AK_CHECK(n == bytes || !std::ferror(_fh.get()), file, "I/O error reading file ({}).", strerror(errno));
	return n;
}

///////////////////////////////////////////////////////////

void zline_reader::open(const char* path)
{
	if (strcmp(path, stdin_path) == 0) {
		line_reader::open(path);
		return;
	}
	// gzread passes plain (non-gzip) files through unchanged
	_zfh = { gzopen(path, "rb"), &gzclose };
	AK_CHECK(_zfh, file, "Could not open {} for reading ({}).", path, strerror(errno));
	advance();  // OK to call virtual because VMT for zline_reader will be loaded by now
}

size_t zline_reader::fread(char* dst, size_t bytes)
{
	if (_zfh) {
		int result = gzread(_zfh.get(), dst, (unsigned)bytes);
		AK_CHECK(result >= 0, file, "I/O error reading compressed file ({}).", strerror(errno));
		return (size_t)result;
	}
	return line_reader::fread(dst, bytes);
}

///////////////////////////////////////////////////////////

void mmap_file::mmap_deleter::operator()(const void* ptr) const noexcept
{
	if (ptr != nullptr && ptr != MAP_FAILED)
		munmap(ccast<void*>(ptr), size);
}

void mmap_file::open(const string& path)
{
	struct unique_fd {
		NOCOPY(unique_fd)
		unique_fd(int fd) noexcept
			: fd(fd)
		{
		}
		~unique_fd() noexcept { if (fd >= 0) ::close(fd); }
		int fd;
	};
	unique_fd fh { ::open(path.c_str(), O_RDONLY) };
	AK_CHECK(fh.fd >= 0, file, "Could not open {} for reading ({})", path, strerror(errno));

	off_t file_size = lseek(fh.fd, 0, SEEK_END);
	AK_CHECK(file_size >= 0, file, "Could not determine file size for {} ({})", path, strerror(errno));
	AK_CHECK(file_size > 0, file, "Cannot map empty file {}", path);

	_data = { mmap(nullptr, (size_t)file_size, PROT_READ, MAP_SHARED, fh.fd, 0), mmap_deleter{ (size_t)file_size } };
	if (_data.get() == MAP_FAILED) {
		_data.reset();
		AK_THROW(file, "Could not map view of file {} ({})", path, strerror(errno));
	}

	// Closing POSIX file does not cause it to be unmapped.
	_size = (size_t)file_size;
	_seek = 0;
}

void mmap_file::close()
{
	_data.reset();
	_size = 0;
	_seek = 0;
}

void mmap_file::read_bytes(void* dst, size_t n)
{
	AK_CHECK(_seek + n <= _size, file, "Read of {} bytes at offset {} runs past end of mapped file ({} bytes)", n, _seek, _size);
	memcpy(dst, data() + _seek, n);
	_seek += n;
}

void mmap_file::read_str(string& s)
{
	auto n = read<uint32_t>();
	AK_CHECK(_seek + n <= _size, file, "String of {} bytes at offset {} runs past end of mapped file", n, _seek);
	s.assign(data() + _seek, n);
	_seek += n;
}

void mmap_file::read_checkpoint(unsigned magic)
{
	auto actual = read<unsigned>();
	AK_CHECK(magic == actual, file, "File I/O checkpoint expected to be '{:x}' but found '{:x}'. Binary file format does not match expectations.", magic, actual);
}

END_NAMESPACE_AK
