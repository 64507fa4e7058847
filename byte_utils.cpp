#include "byte_utils.hpp"

#include <cstring>

uint16_t read_be16(const char *p)
{
    const unsigned char *u = reinterpret_cast<const unsigned char *>(p);
    return static_cast<uint16_t>((u[0] << 8) | u[1]);
}

uint32_t read_be32(const char *p)
{
    const unsigned char *u = reinterpret_cast<const unsigned char *>(p);
    return (static_cast<uint32_t>(u[0]) << 24) |
           (static_cast<uint32_t>(u[1]) << 16) |
           (static_cast<uint32_t>(u[2]) << 8) |
           static_cast<uint32_t>(u[3]);
}

int64_t read_be_int(const char *p, size_t n)
{
    const unsigned char *u = reinterpret_cast<const unsigned char *>(p);
    uint64_t v = 0;
    for (size_t i = 0; i < n; ++i)
        v = (v << 8) | u[i];

    // sign-extend from the top bit of the first byte
    if (n < 8 && (u[0] & 0x80))
        v |= ~uint64_t(0) << (8 * n);
    return static_cast<int64_t>(v);
}

double read_be_double(const char *p)
{
    const unsigned char *u = reinterpret_cast<const unsigned char *>(p);
    uint64_t bits = 0;
    for (size_t i = 0; i < 8; ++i)
        bits = (bits << 8) | u[i];

    double d;
    std::memcpy(&d, &bits, sizeof(d));
    return d;
}

bool read_varint(const char *data, size_t size, size_t &offset, uint64_t &value)
{
    const unsigned char *u = reinterpret_cast<const unsigned char *>(data);
    uint64_t v = 0;
    size_t pos = offset;

    for (int i = 0; i < 9; ++i)
    {
        if (pos >= size)
            return false;

        unsigned char byte = u[pos++];
        if (i == 8)
        {
            // ninth byte contributes all 8 bits
            v = (v << 8) | byte;
            break;
        }

        v = (v << 7) | (byte & 0x7f);
        if (!(byte & 0x80))
            break;
    }

    offset = pos;
    value = v;
    return true;
}
