#pragma once

#include <cstddef>
#include <cstdint>

// Big-endian readers over raw page bytes
uint16_t read_be16(const char *p);
uint32_t read_be32(const char *p);

// Signed two's-complement big-endian integer of n bytes (1..8)
int64_t read_be_int(const char *p, size_t n);

// IEEE-754 double stored big-endian
double read_be_double(const char *p);

// Decode a SQLite varint (1..9 bytes) at data[offset].
// On success advances offset past the varint. Fails without touching
// offset when the buffer ends first.
bool read_varint(const char *data, size_t size, size_t &offset, uint64_t &value);
