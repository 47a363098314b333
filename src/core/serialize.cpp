// StakeLedger - Serialization Implementation
// Copyright (c) 2024 StakeLedger Developers
// MIT License

#include <stakeledger/core/serialize.h>

namespace stakeledger {

void WriteU8(DataStream& s, uint8_t v) {
    s.Write(&v, 1);
}

void WriteU64(DataStream& s, uint64_t v) {
    uint8_t buf[8];
    for (int i = 0; i < 8; ++i) {
        buf[i] = static_cast<uint8_t>(v >> (8 * i));
    }
    s.Write(buf, 8);
}

void WriteI64(DataStream& s, int64_t v) {
    WriteU64(s, static_cast<uint64_t>(v));
}

void WriteCompactSize(DataStream& s, uint64_t v) {
    if (v < 253) {
        WriteU8(s, static_cast<uint8_t>(v));
    } else if (v <= 0xFFFF) {
        WriteU8(s, 253);
        uint8_t buf[2] = {static_cast<uint8_t>(v), static_cast<uint8_t>(v >> 8)};
        s.Write(buf, 2);
    } else if (v <= 0xFFFFFFFF) {
        WriteU8(s, 254);
        uint8_t buf[4];
        for (int i = 0; i < 4; ++i) buf[i] = static_cast<uint8_t>(v >> (8 * i));
        s.Write(buf, 4);
    } else {
        WriteU8(s, 255);
        WriteU64(s, v);
    }
}

void WriteString(DataStream& s, const std::string& v) {
    WriteCompactSize(s, v.size());
    s.Write(reinterpret_cast<const uint8_t*>(v.data()), v.size());
}

void WriteAmount(DataStream& s, const Amount& v) {
    auto bytes = v.ToBigEndian();
    s.Write(bytes.data(), bytes.size());
}

void WriteAddress(DataStream& s, const Address& v) {
    s.Write(v.data(), v.size());
}

uint8_t ReadU8(DataStream& s) {
    uint8_t v;
    s.Read(&v, 1);
    return v;
}

uint64_t ReadU64(DataStream& s) {
    uint8_t buf[8];
    s.Read(buf, 8);
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | buf[i];
    }
    return v;
}

int64_t ReadI64(DataStream& s) {
    return static_cast<int64_t>(ReadU64(s));
}

uint64_t ReadCompactSize(DataStream& s) {
    uint8_t marker = ReadU8(s);
    if (marker < 253) {
        return marker;
    }
    int width = marker == 253 ? 2 : (marker == 254 ? 4 : 8);
    uint8_t buf[8] = {0};
    s.Read(buf, static_cast<size_t>(width));
    uint64_t v = 0;
    for (int i = width - 1; i >= 0; --i) {
        v = (v << 8) | buf[i];
    }
    return v;
}

std::string ReadString(DataStream& s) {
    uint64_t len = ReadCompactSize(s);
    if (len > MAX_STRING_SIZE) {
        throw std::ios_base::failure("ReadString(): size too large");
    }
    std::string v(static_cast<size_t>(len), '\0');
    if (len > 0) {
        s.Read(reinterpret_cast<uint8_t*>(&v[0]), static_cast<size_t>(len));
    }
    return v;
}

Amount ReadAmount(DataStream& s) {
    uint8_t buf[32];
    s.Read(buf, 32);
    return Amount::FromBigEndian(buf);
}

Address ReadAddress(DataStream& s) {
    Byte buf[Address::SIZE];
    s.Read(buf, Address::SIZE);
    return Address(buf, Address::SIZE);
}

} // namespace stakeledger
