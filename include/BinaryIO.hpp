#pragma once

#include <cstdint>
#include <fstream>
#include <string>

template<typename T>
bool ReadBinary(std::istream& stream, T& value)
{
    return static_cast<bool>(stream.read(reinterpret_cast<char*>(&value), sizeof(T)));
}

template<typename T>
bool WriteBinary(std::ostream& stream, const T& value)
{
    return static_cast<bool>(stream.write(reinterpret_cast<const char*>(&value), sizeof(T)));
}

// uint32 length prefix followed by the raw bytes
inline bool ReadString(std::istream& stream, std::string& value, uint32_t maxLen = 1u << 20)
{
    uint32_t len = 0;
    if (!ReadBinary(stream, len) || len > maxLen)
    {
        return false;
    }
    value.assign(len, '\0');
    return len == 0 || static_cast<bool>(stream.read(&value[0], len));
}

inline bool WriteString(std::ostream& stream, const std::string& value)
{
    uint32_t len = static_cast<uint32_t>(value.size());
    return WriteBinary(stream, len) && static_cast<bool>(stream.write(value.data(), len));
}
