#pragma once
#include <cstdint>
#include <string>

// CRC32 of a whole file, streamed. Returns false if the file can't be read.
bool file_crc32(const std::string& path, uint32_t* out);

// Makes renames/unlinks inside `dir` durable.
bool fsync_dir(const std::string& dir);
