#pragma once
// -------------------------------------------------------------------------------------
#include <cstring>
#include <exception>
#include <string>
// -------------------------------------------------------------------------------------
#define GenericException(name)                                                   \
  struct name : public std::exception {                                          \
    const std::string msg;                                                       \
    explicit name() : msg(#name) {}                                              \
    explicit name(const std::string& msg) : msg(msg) {}                          \
    ~name() = default;                                                           \
    virtual const char* what() const noexcept override { return msg.c_str(); }  \
  };
// -------------------------------------------------------------------------------------
// Decode errors form a small hierarchy so callers can catch DecodeException
// without caring which check fired.
#define DecodeExceptionType(name, base)                                          \
  struct name : public base {                                                    \
    explicit name() : base(#name) {}                                             \
    explicit name(const std::string& msg) : base(std::string(#name ": ") + msg) {} \
  };
// -------------------------------------------------------------------------------------
#define UNREACHABLE() \
  throw tsblocks::Generic_Exception("unreachable code reached: " + std::string(__FILE__) + ":" + std::to_string(__LINE__))
// -------------------------------------------------------------------------------------
#define die_if(expr)                                                              \
  if (!(expr)) {                                                                  \
    throw tsblocks::Generic_Exception("invariant failed: " #expr " at " +         \
                                      std::string(__FILE__) + ":" + std::to_string(__LINE__)); \
  }
// -------------------------------------------------------------------------------------
namespace tsblocks {
// -------------------------------------------------------------------------------------
GenericException(Generic_Exception);
// -------------------------------------------------------------------------------------
struct DecodeException : public Generic_Exception {
  explicit DecodeException(const std::string& msg) : Generic_Exception(msg) {}
};
// -------------------------------------------------------------------------------------
// buffer exhausted inside a bit stream
DecodeExceptionType(InsufficientBits, DecodeException);
// buffer exhausted inside a byte-aligned payload
DecodeExceptionType(TruncatedPayload, DecodeException);
DecodeExceptionType(TruncatedVarint, TruncatedPayload);
// no decoder registered for the tag, usually format/version skew
DecodeExceptionType(UnknownMethodTag, DecodeException);
// bit field math yields an impossible width
DecodeExceptionType(CorruptXorStream, DecodeException);
// structurally impossible payload content (bad counts, trailing bytes, ...)
DecodeExceptionType(CorruptPayload, DecodeException);
// -------------------------------------------------------------------------------------
}  // namespace tsblocks
// -------------------------------------------------------------------------------------
