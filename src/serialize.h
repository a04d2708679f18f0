// Copyright (c) 2025 The PIVX Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DONATION_SERIALIZE_H
#define DONATION_SERIALIZE_H

#include "optional.h"

#include <stdint.h>
#include <string.h>

#include <ios>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

static const unsigned int MAX_SIZE = 0x02000000;

enum {
    // primary actions
    SER_NETWORK = (1 << 0),
    SER_DISK = (1 << 1),
    SER_GETHASH = (1 << 2),
};

/*
 * Lowest-level serialization and conversion.
 * All integers are written little-endian.
 */
template <typename Stream>
inline void ser_writedata8(Stream& s, uint8_t obj)
{
    s.write((char*)&obj, 1);
}
template <typename Stream>
inline void ser_writedata16(Stream& s, uint16_t obj)
{
    unsigned char buf[2] = {(unsigned char)obj, (unsigned char)(obj >> 8)};
    s.write((char*)buf, 2);
}
template <typename Stream>
inline void ser_writedata32(Stream& s, uint32_t obj)
{
    unsigned char buf[4];
    for (int i = 0; i < 4; i++) buf[i] = (unsigned char)(obj >> (8 * i));
    s.write((char*)buf, 4);
}
template <typename Stream>
inline void ser_writedata64(Stream& s, uint64_t obj)
{
    unsigned char buf[8];
    for (int i = 0; i < 8; i++) buf[i] = (unsigned char)(obj >> (8 * i));
    s.write((char*)buf, 8);
}
template <typename Stream>
inline uint8_t ser_readdata8(Stream& s)
{
    uint8_t obj;
    s.read((char*)&obj, 1);
    return obj;
}
template <typename Stream>
inline uint16_t ser_readdata16(Stream& s)
{
    unsigned char buf[2];
    s.read((char*)buf, 2);
    return (uint16_t)buf[0] | ((uint16_t)buf[1] << 8);
}
template <typename Stream>
inline uint32_t ser_readdata32(Stream& s)
{
    unsigned char buf[4];
    s.read((char*)buf, 4);
    uint32_t obj = 0;
    for (int i = 3; i >= 0; i--) obj = (obj << 8) | buf[i];
    return obj;
}
template <typename Stream>
inline uint64_t ser_readdata64(Stream& s)
{
    unsigned char buf[8];
    s.read((char*)buf, 8);
    uint64_t obj = 0;
    for (int i = 7; i >= 0; i--) obj = (obj << 8) | buf[i];
    return obj;
}

/////////////////////////////////////////////////////////////////
//
// Templates for serializing to anything that looks like a stream,
// i.e. anything that supports .read(char*, size_t) and .write(char*, size_t)
//

/**
 * Implement the Ser and Unser methods needed for implementing a formatter (see Using below).
 *
 * Both Ser and Unser are delegated to a single static method SerializationOps, which is polymorphic
 * in the serialized/deserialized type (allowing it to be const when serializing, and non-const when
 * deserializing).
 */
#define FORMATTER_METHODS(cls, obj)                                                       \
    template <typename Stream>                                                            \
    static void Ser(Stream& s, const cls& obj) { SerializationOps(obj, s, CSerActionSerialize()); } \
    template <typename Stream>                                                            \
    static void Unser(Stream& s, cls& obj) { SerializationOps(obj, s, CSerActionUnserialize()); } \
    template <typename Stream, typename Type, typename Operation>                          \
    static inline void SerializationOps(Type& obj, Stream& s, Operation ser_action)

/**
 * Implement the Serialize and Unserialize methods by delegating to a single templated
 * static method that takes the to-be-(de)serialized object as a parameter. This approach
 * has the advantage that the constness of the object becomes a template parameter, and
 * thus allows a single implementation that sees the object as const for serializing
 * and non-const for deserializing, without casts.
 */
#define SERIALIZE_METHODS(cls, obj)                                                                   \
    template <typename Stream>                                                                        \
    void Serialize(Stream& s) const                                                                   \
    {                                                                                                 \
        static_assert(std::is_same<const cls&, decltype(*this)>::value, "Serialize type mismatch");   \
        Ser(s, *this);                                                                                \
    }                                                                                                 \
    template <typename Stream>                                                                        \
    void Unserialize(Stream& s)                                                                       \
    {                                                                                                 \
        static_assert(std::is_same<cls&, decltype(*this)>::value, "Unserialize type mismatch");       \
        Unser(s, *this);                                                                              \
    }                                                                                                 \
    FORMATTER_METHODS(cls, obj)

#define READWRITE(...) (::SerReadWriteMany(s, ser_action, __VA_ARGS__))

struct CSerActionSerialize {
    constexpr bool ForRead() const { return false; }
};
struct CSerActionUnserialize {
    constexpr bool ForRead() const { return true; }
};

// clang-format off
template <typename Stream> inline void Serialize(Stream& s, char a)     { ser_writedata8(s, a); }
template <typename Stream> inline void Serialize(Stream& s, int8_t a)   { ser_writedata8(s, a); }
template <typename Stream> inline void Serialize(Stream& s, uint8_t a)  { ser_writedata8(s, a); }
template <typename Stream> inline void Serialize(Stream& s, int16_t a)  { ser_writedata16(s, a); }
template <typename Stream> inline void Serialize(Stream& s, uint16_t a) { ser_writedata16(s, a); }
template <typename Stream> inline void Serialize(Stream& s, int32_t a)  { ser_writedata32(s, a); }
template <typename Stream> inline void Serialize(Stream& s, uint32_t a) { ser_writedata32(s, a); }
template <typename Stream> inline void Serialize(Stream& s, int64_t a)  { ser_writedata64(s, a); }
template <typename Stream> inline void Serialize(Stream& s, uint64_t a) { ser_writedata64(s, a); }
template <typename Stream> inline void Serialize(Stream& s, bool a)     { char f = a; ser_writedata8(s, f); }

template <typename Stream> inline void Unserialize(Stream& s, char& a)     { a = ser_readdata8(s); }
template <typename Stream> inline void Unserialize(Stream& s, int8_t& a)   { a = ser_readdata8(s); }
template <typename Stream> inline void Unserialize(Stream& s, uint8_t& a)  { a = ser_readdata8(s); }
template <typename Stream> inline void Unserialize(Stream& s, int16_t& a)  { a = ser_readdata16(s); }
template <typename Stream> inline void Unserialize(Stream& s, uint16_t& a) { a = ser_readdata16(s); }
template <typename Stream> inline void Unserialize(Stream& s, int32_t& a)  { a = ser_readdata32(s); }
template <typename Stream> inline void Unserialize(Stream& s, uint32_t& a) { a = ser_readdata32(s); }
template <typename Stream> inline void Unserialize(Stream& s, int64_t& a)  { a = ser_readdata64(s); }
template <typename Stream> inline void Unserialize(Stream& s, uint64_t& a) { a = ser_readdata64(s); }
template <typename Stream> inline void Unserialize(Stream& s, bool& a)     { char f = ser_readdata8(s); a = f; }
// clang-format on

/**
 * Compact Size
 * size <  253        -- 1 byte
 * size <= USHRT_MAX  -- 3 bytes  (253 + 2 bytes)
 * size <= UINT_MAX   -- 5 bytes  (254 + 4 bytes)
 * size >  UINT_MAX   -- 9 bytes  (255 + 8 bytes)
 */
inline unsigned int GetSizeOfCompactSize(uint64_t nSize)
{
    if (nSize < 253)
        return sizeof(unsigned char);
    else if (nSize <= std::numeric_limits<unsigned short>::max())
        return sizeof(unsigned char) + sizeof(unsigned short);
    else if (nSize <= std::numeric_limits<unsigned int>::max())
        return sizeof(unsigned char) + sizeof(unsigned int);
    else
        return sizeof(unsigned char) + sizeof(uint64_t);
}

template <typename Stream>
void WriteCompactSize(Stream& os, uint64_t nSize)
{
    if (nSize < 253) {
        ser_writedata8(os, nSize);
    } else if (nSize <= std::numeric_limits<unsigned short>::max()) {
        ser_writedata8(os, 253);
        ser_writedata16(os, nSize);
    } else if (nSize <= std::numeric_limits<unsigned int>::max()) {
        ser_writedata8(os, 254);
        ser_writedata32(os, nSize);
    } else {
        ser_writedata8(os, 255);
        ser_writedata64(os, nSize);
    }
}

template <typename Stream>
uint64_t ReadCompactSize(Stream& is)
{
    uint8_t chSize = ser_readdata8(is);
    uint64_t nSizeRet = 0;
    if (chSize < 253) {
        nSizeRet = chSize;
    } else if (chSize == 253) {
        nSizeRet = ser_readdata16(is);
        if (nSizeRet < 253)
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
    } else if (chSize == 254) {
        nSizeRet = ser_readdata32(is);
        if (nSizeRet < 0x10000u)
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
    } else {
        nSizeRet = ser_readdata64(is);
        if (nSizeRet < 0x100000000ULL)
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
    }
    if (nSizeRet > (uint64_t)MAX_SIZE)
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    return nSizeRet;
}

/**
 * Forward declarations
 */

/**
 *  string
 */
template <typename Stream, typename C>
void Serialize(Stream& os, const std::basic_string<C>& str);
template <typename Stream, typename C>
void Unserialize(Stream& is, std::basic_string<C>& str);

/**
 * vector
 */
template <typename Stream, typename T, typename A>
void Serialize(Stream& os, const std::vector<T, A>& v);
template <typename Stream, typename T, typename A>
void Unserialize(Stream& is, std::vector<T, A>& v);

/**
 * pair
 */
template <typename Stream, typename K, typename T>
void Serialize(Stream& os, const std::pair<K, T>& item);
template <typename Stream, typename K, typename T>
void Unserialize(Stream& is, std::pair<K, T>& item);

/**
 * optional
 */
template <typename Stream, typename T>
void Serialize(Stream& os, const Optional<T>& item);
template <typename Stream, typename T>
void Unserialize(Stream& is, Optional<T>& item);

/**
 * If none of the specialized versions above matched, default to calling member function.
 */
template <typename Stream, typename T>
inline void Serialize(Stream& os, const T& a)
{
    a.Serialize(os);
}

template <typename Stream, typename T>
inline void Unserialize(Stream& is, T&& a)
{
    a.Unserialize(is);
}

/**
 * string
 */
template <typename Stream, typename C>
void Serialize(Stream& os, const std::basic_string<C>& str)
{
    WriteCompactSize(os, str.size());
    if (!str.empty())
        os.write((char*)str.data(), str.size() * sizeof(C));
}

template <typename Stream, typename C>
void Unserialize(Stream& is, std::basic_string<C>& str)
{
    unsigned int nSize = ReadCompactSize(is);
    str.resize(nSize);
    if (nSize != 0)
        is.read((char*)str.data(), nSize * sizeof(C));
}

/**
 * vector
 */
template <typename Stream, typename T, typename A>
void Serialize(Stream& os, const std::vector<T, A>& v)
{
    WriteCompactSize(os, v.size());
    if (std::is_same<T, unsigned char>::value || std::is_same<T, char>::value) {
        if (!v.empty())
            os.write((char*)v.data(), v.size() * sizeof(T));
    } else {
        for (const T& elem : v) {
            ::Serialize(os, elem);
        }
    }
}

template <typename Stream, typename T, typename A>
void Unserialize(Stream& is, std::vector<T, A>& v)
{
    v.clear();
    unsigned int nSize = ReadCompactSize(is);
    if (std::is_same<T, unsigned char>::value || std::is_same<T, char>::value) {
        v.resize(nSize);
        if (nSize != 0)
            is.read((char*)v.data(), nSize * sizeof(T));
    } else {
        v.reserve(nSize);
        for (unsigned int i = 0; i < nSize; i++) {
            v.emplace_back();
            ::Unserialize(is, v.back());
        }
    }
}

/**
 * pair
 */
template <typename Stream, typename K, typename T>
void Serialize(Stream& os, const std::pair<K, T>& item)
{
    ::Serialize(os, item.first);
    ::Serialize(os, item.second);
}

template <typename Stream, typename K, typename T>
void Unserialize(Stream& is, std::pair<K, T>& item)
{
    ::Unserialize(is, item.first);
    ::Unserialize(is, item.second);
}

/**
 * optional: one presence byte, followed by the value when present
 */
template <typename Stream, typename T>
void Serialize(Stream& os, const Optional<T>& item)
{
    if (item) {
        ser_writedata8(os, 1);
        ::Serialize(os, *item);
    } else {
        ser_writedata8(os, 0);
    }
}

template <typename Stream, typename T>
void Unserialize(Stream& is, Optional<T>& item)
{
    uint8_t fPresent = ser_readdata8(is);
    if (fPresent == 0) {
        item = nullopt;
    } else if (fPresent == 1) {
        T object;
        ::Unserialize(is, object);
        item = object;
    } else {
        throw std::ios_base::failure("non-canonical Optional presence byte");
    }
}

template <typename Stream>
void SerializeMany(Stream& s)
{
}

template <typename Stream, typename Arg, typename... Args>
void SerializeMany(Stream& s, const Arg& arg, const Args&... args)
{
    ::Serialize(s, arg);
    ::SerializeMany(s, args...);
}

template <typename Stream>
inline void UnserializeMany(Stream& s)
{
}

template <typename Stream, typename Arg, typename... Args>
inline void UnserializeMany(Stream& s, Arg&& arg, Args&&... args)
{
    ::Unserialize(s, arg);
    ::UnserializeMany(s, args...);
}

template <typename Stream, typename... Args>
inline void SerReadWriteMany(Stream& s, CSerActionSerialize ser_action, const Args&... args)
{
    ::SerializeMany(s, args...);
}

template <typename Stream, typename... Args>
inline void SerReadWriteMany(Stream& s, CSerActionUnserialize ser_action, Args&&... args)
{
    ::UnserializeMany(s, args...);
}

/**
 * ::GetSerializeSize implementations
 *
 * Computing the serialized size of objects is done through a special stream
 * object of type CSizeComputer, which only records the number of bytes written
 * to it.
 */
class CSizeComputer
{
protected:
    size_t nSize;

    const int nVersion;

public:
    explicit CSizeComputer(int nVersionIn) : nSize(0), nVersion(nVersionIn) {}

    void write(const char* psz, size_t _nSize)
    {
        this->nSize += _nSize;
    }

    template <typename T>
    CSizeComputer& operator<<(const T& obj)
    {
        ::Serialize(*this, obj);
        return (*this);
    }

    size_t size() const
    {
        return nSize;
    }
    int GetVersion() const { return nVersion; }
    int GetType() const { return SER_NETWORK; }
};

template <typename T>
size_t GetSerializeSize(const T& t, int nVersion = 0)
{
    return (CSizeComputer(nVersion) << t).size();
}

#endif // DONATION_SERIALIZE_H
