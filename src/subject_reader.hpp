#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace rexbind {
namespace subject_reader {

class subject_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Read a file as raw bytes. Gzip-compressed files (1f 8b magic) are
// inflated transparently. "-" reads standard input.
std::string read_subject(const std::string& path);

bool is_gzip(std::string_view data);

// Inflate a complete gzip stream; throws subject_error on corrupt input
std::string inflate_gzip(std::string_view data);

// Compress data into a gzip stream
std::string deflate_gzip(std::string_view data);

} // namespace subject_reader
} // namespace rexbind
