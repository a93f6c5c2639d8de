#pragma once

#include <string>
#include "core/errors/tandem_errors.hpp"

namespace tandem::transport {

// Raw duplex byte stream carrying one frame per call. Not safe for concurrent
// writers; ConnectionWriter is the only caller of `write_frame`.
class Transport {
public:
    virtual ~Transport() = default;

    virtual core::errors::Status write_frame(const std::string& frame) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

}  // namespace tandem::transport
