#pragma once

/**
 * @file sink.hxx
 * @brief Output sinks for profile export (in-memory, std::ostream and file)
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <filesystem>
#include <fstream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace rprof {

// ─────────────────────────────────────────────────────────────────────────────
// Errors
// ─────────────────────────────────────────────────────────────────────────────

/// Raised by any sink operation that could not complete.
struct SinkError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// Raised when a sink's destination cannot be created or opened.
struct SinkOpenError : SinkError {
    using SinkError::SinkError;
};

// ─────────────────────────────────────────────────────────────────────────────
// Sink
// ─────────────────────────────────────────────────────────────────────────────

/**
 * Destination for exported profile data: ordered byte writes plus flush.
 * No seeking or reading is ever required.
 *
 * Both operations report failure by throwing SinkError.
 */
class Sink {
   public:
    Sink() = default;
    virtual ~Sink() = default;
    Sink(const Sink&) = delete;
    Sink(Sink&&) = delete;
    auto operator=(const Sink&) -> Sink& = delete;
    auto operator=(Sink&&) -> Sink& = delete;

    virtual void write(std::string_view bytes) = 0;
    virtual void flush() = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// StringSink
// ─────────────────────────────────────────────────────────────────────────────

/// Accumulates everything in an owned string. Never fails short of bad_alloc.
class StringSink final : public Sink {
   public:
    void write(std::string_view bytes) override { buffer_.append(bytes); }
    void flush() override {}

    [[nodiscard]] auto str() const -> const std::string& { return buffer_; }
    [[nodiscard]] auto size() const -> std::size_t { return buffer_.size(); }
    void clear() { buffer_.clear(); }

   private:
    std::string buffer_;
};

// ─────────────────────────────────────────────────────────────────────────────
// OStreamSink
// ─────────────────────────────────────────────────────────────────────────────

/**
 * Adapts a caller-owned std::ostream. The stream must outlive the sink.
 * A stream that ends up in a failed state turns into a SinkError.
 */
class OStreamSink final : public Sink {
   public:
    explicit OStreamSink(std::ostream& out) : out_(out) {}

    void write(std::string_view bytes) override {
        out_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!out_) {
            throw SinkError("stream write failed");
        }
    }

    void flush() override {
        out_.flush();
        if (!out_) {
            throw SinkError("stream flush failed");
        }
    }

   private:
    std::ostream& out_;
};

// ─────────────────────────────────────────────────────────────────────────────
// FileSink
// ─────────────────────────────────────────────────────────────────────────────

/// Owns a file opened for truncating binary writes.
class FileSink final : public Sink {
   public:
    /// @throws SinkOpenError if the file cannot be created.
    explicit FileSink(std::filesystem::path path) : path_(std::move(path)) {
        file_.open(path_, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!file_.is_open()) {
            throw SinkOpenError("cannot create file: " + path_.string());
        }
    }

    void write(std::string_view bytes) override {
        file_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        if (!file_) {
            throw SinkError("write failed: " + path_.string());
        }
    }

    void flush() override {
        file_.flush();
        if (!file_) {
            throw SinkError("flush failed: " + path_.string());
        }
    }

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

   private:
    std::filesystem::path path_;
    std::ofstream file_;
};

}  // namespace rprof
