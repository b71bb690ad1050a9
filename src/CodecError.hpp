#ifndef CODEC_ERROR_HPP
#define CODEC_ERROR_HPP

#include <stdexcept>
#include <string>

class CodecError : public std::runtime_error {
public:
    explicit CodecError(const std::string& message) : std::runtime_error(message) {}
};

// Bitmap side is not a power of two >= 2, or buffer length does not match rank*rank
class InvalidDimensions : public CodecError {
public:
    explicit InvalidDimensions(const std::string& message) : CodecError(message) {}
};

// Image loader could not produce pixel data
class DecodeFailure : public CodecError {
public:
    explicit DecodeFailure(const std::string& message) : CodecError(message) {}
};

// Query point outside [0, rank)
class OutOfBounds : public CodecError {
public:
    explicit OutOfBounds(const std::string& message) : CodecError(message) {}
};

// Structure / leaf-data streams truncated or inconsistent
class FormatError : public CodecError {
public:
    explicit FormatError(const std::string& message) : CodecError(message) {}
};

#endif
