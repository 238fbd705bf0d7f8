#pragma once
#include <array>
#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>

#include "address.h"

namespace mpay {

// Little-endian append-only encoder
class ByteWriter {
public:
    void u8(uint8_t x){ v_.push_back(x); }
    void u32(uint32_t x){ for(int i=0;i<4;i++) v_.push_back(uint8_t((x>>(i*8))&0xff)); }
    void u64(uint64_t x){ for(int i=0;i<8;i++) v_.push_back(uint8_t((x>>(i*8))&0xff)); }
    void i64(int64_t x){ u64(static_cast<uint64_t>(x)); }
    void raw(const uint8_t* p, size_t n){ v_.insert(v_.end(), p, p+n); }
    template <size_t N>
    void fixed(const std::array<uint8_t, N>& a){ raw(a.data(), N); }
    void address(const Address& a){ fixed(a.bytes); }
    // u32 length prefix
    void var(const std::vector<uint8_t>& b){ u32((uint32_t)b.size()); raw(b.data(), b.size()); }
    void str(const std::string& s){ u32((uint32_t)s.size()); raw(reinterpret_cast<const uint8_t*>(s.data()), s.size()); }

    const std::vector<uint8_t>& bytes() const { return v_; }
    std::vector<uint8_t> take(){ return std::move(v_); }
private:
    std::vector<uint8_t> v_;
};

// Bounds-checked decoder; every getter returns false on truncation
class ByteReader {
public:
    ByteReader(const uint8_t* p, size_t n) : p_(p), n_(n) {}
    explicit ByteReader(const std::vector<uint8_t>& v) : p_(v.data()), n_(v.size()) {}
    explicit ByteReader(const std::string& s) : p_(reinterpret_cast<const uint8_t*>(s.data())), n_(s.size()) {}

    bool u8(uint8_t& x){ if(i_+1>n_) return false; x=p_[i_++]; return true; }
    bool u32(uint32_t& x){
        if(i_+4>n_) return false;
        x=0; for(int k=0;k<4;k++) x |= (uint32_t)p_[i_+k] << (k*8);
        i_+=4; return true;
    }
    bool u64(uint64_t& x){
        if(i_+8>n_) return false;
        x=0; for(int k=0;k<8;k++) x |= (uint64_t)p_[i_+k] << (k*8);
        i_+=8; return true;
    }
    bool i64(int64_t& x){ uint64_t u; if(!u64(u)) return false; x=static_cast<int64_t>(u); return true; }
    template <size_t N>
    bool fixed(std::array<uint8_t, N>& a){ if(i_+N>n_) return false; for(size_t k=0;k<N;k++) a[k]=p_[i_+k]; i_+=N; return true; }
    bool address(Address& a){ return fixed(a.bytes); }
    bool var(std::vector<uint8_t>& out, size_t max_len = 1u<<20){
        uint32_t sz; if(!u32(sz)) return false;
        if(sz>max_len || i_+sz>n_) return false;
        out.assign(p_+i_, p_+i_+sz); i_+=sz; return true;
    }
    bool str(std::string& out, size_t max_len = 1u<<16){
        uint32_t sz; if(!u32(sz)) return false;
        if(sz>max_len || i_+sz>n_) return false;
        out.assign(reinterpret_cast<const char*>(p_+i_), sz); i_+=sz; return true;
    }

    bool done() const { return i_==n_; }
    size_t remaining() const { return n_-i_; }
private:
    const uint8_t* p_;
    size_t n_;
    size_t i_{0};
};

}
