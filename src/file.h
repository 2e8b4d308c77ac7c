/*
Copyright (C) 2016-2023 Deep Genomics Inc. All Rights Reserved.
*/
#pragma once
#ifndef __ALIGN_KIT_FILE_H__
#define __ALIGN_KIT_FILE_H__

#include "ak_assert.h"
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

struct gzFile_s;

BEGIN_NAMESPACE_AK
using std::memcpy;
using std::string;
using std::vector;

bool is_file(const string& path);
string prepend_dir(std::string_view dir, std::string_view filename);

// Directory part of a path ("." if it has none) and the part after the last '/'.
string dir_name(const string& path);
string base_name(const string& path);

// Directory for temporary files: $TMPDIR if set, else /tmp.
string default_tmp_dir();

// Creates a new, empty, uniquely named file "<dir>/<prefix>XXXXXX<suffix>" and returns its path.
string make_temp_file(const string& dir, std::string_view prefix, std::string_view suffix = {});

// Both return false (with errno set) rather than throwing; callers decide whether failure is fatal.
bool remove_file(const string& path);
bool rename_file(const string& from, const string& to);

// Reads up to n leading bytes of a file; fewer if the file is shorter.
string read_file_prefix(const string& path, size_t n);

template <class T>
concept serializable = std::is_trivially_copyable_v<T> && !std::is_pointer_v<T>;

///////////////////////////////////////////////////////////////////////

class binary_file {
public:
	binary_file() = default;
	binary_file(const string& path, const char* mode) { open(path, mode); }

	void open(const string& path, const char* mode);
	void close();
	void flush();

	INLINE bool is_open() const { return scast<bool>(_fh); }
	INLINE const string& path() const { return _path; }

	void set_seek(size_t offset);
	long long tell() const;

	void read(       void* dst, size_t item_size, size_t num_items);
	void write(const void* src, size_t item_size, size_t num_items);

	// Read/write several items
	template <serializable T> INLINE void read(       T* items, size_t num_items) { read( items, sizeof(T), num_items); }
	template <serializable T> INLINE void write(const T* items, size_t num_items) { write(items, sizeof(T), num_items); }

	// Read/write single item
	template <serializable T> INLINE void read(       T& item) { read( &item, 1); }
	template <serializable T> INLINE void write(const T& item) { write(&item, 1); }
	template <serializable T> INLINE T    read()               { T item; read(item); return item; }

	// Length-prefixed string
	void   write_str(std::string_view s);
	void   read_str(string& s);

	// Raw text, no length prefix
	void   write_text(std::string_view s) { write(s.data(), 1, s.size()); }

	// Read/write a checkpoint. Useful for sanity checking file contents.
	void write_checkpoint(unsigned magic);
	void read_checkpoint(unsigned magic);

private:
	std::unique_ptr<std::FILE, decltype(&std::fclose)> _fh{ nullptr, [](auto) { return 0; } };
	string _path;
};

/////////////////////////////////////////////////////////////////////

extern const char* stdin_path; // Special path that causes line_reader to pull from stdin

// Much faster than std::getline
// Results do not include the newline character itself.
class line_reader {
public:
	explicit line_reader(const string& path) { open(path.c_str()); }
	virtual ~line_reader() = default;
	NOCOPY(line_reader)

	INLINE bool             done() const { return _done; }
	INLINE std::string_view line() const { return _line; }
	INLINE line_reader& operator++() { AK_DBASSERT(!done()); advance(); return *this; }
	INLINE long long line_num() const { return _line_num; }

protected:
	line_reader() = default;
	void open(const char* path);
	void advance();
	bool refill();
	virtual size_t fread(char* dst, size_t bytes);

	using unique_file = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

	vector<char>     _buf;            // bytes read from the file but not yet returned as lines
	size_t           _pos{};          // start of the next line within _buf
	size_t           _end{};          // end of valid bytes within _buf
	bool             _eof{};
	bool             _done{};
	std::string_view _line;
	unique_file      _fh { nullptr, [](auto) { return 0; } };
	long long        _line_num{};
};

/////////////////////////////////////////////////////////////////////

// Reads gzip-compressed text transparently; plain files are read as-is.
class zline_reader: public line_reader {
public:
	explicit zline_reader(const string& path) { open(path.c_str()); }

private:
	void open(const char* path); // not virtual
	size_t fread(char* dst, size_t bytes) override;

	std::unique_ptr<gzFile_s, int (*)(gzFile_s*)> _zfh
		{ nullptr, [](auto) { return 0; } };
};

/////////////////////////////////////////////////////////////////////

// Memory-mapped read-only file handle.
//
// Byte ranges of an indexed alignment file are decoded straight out of
// the mapping; only the pages that a query touches are ever paged in,
// and several readers of the same file share the same physical pages.
//
class mmap_file {
public:
	mmap_file() = default;
	explicit mmap_file(const string& path) { open(path); }

	void open(const string& path);
	void close();

	INLINE bool        is_open() const { return scast<bool>(_data); }
	INLINE const char* data()    const { return scast<const char*>(_data.get()); }
	INLINE size_t      size()    const { return _size; }

	INLINE size_t curr_seek() const      { return _seek; }
	INLINE void set_seek(size_t offset)  { _seek =  offset; }

	template <serializable T> INLINE T    read()        { T item; read(item); return item; }
	template <serializable T> INLINE void read(T& item) { read_bytes(&item, sizeof(T)); }
	void read_str(string& s);

	// Read a checkpoint. Useful for sanity checking file contents.
	void read_checkpoint(unsigned magic);

private:
	void read_bytes(void* dst, size_t n);

	struct mmap_deleter {
		size_t size;
		void operator()(const void* ptr) const noexcept;
	};
	std::unique_ptr<const void, mmap_deleter> _data;

	size_t _size{};
	size_t _seek{};
};

END_NAMESPACE_AK

#endif // __ALIGN_KIT_FILE_H__
