#pragma once

/**
 * @file tsv_exporter.hxx
 * @brief Tab-separated serialization of recorded ranges into a Sink
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <format>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "../scope/scope.hxx"
#include "../sink/sink.hxx"

namespace rprof {

/**
 * Writes the range table understood by trace viewers:
 *
 *   thread_id<TAB>range_name<TAB>range_start_nano<TAB>range_end_nano<LF>
 *   <tid><TAB><name><TAB><start><TAB><end><LF>
 *   ...
 *
 * The layout is fixed byte for byte. One Sink::write() per row; SinkError from
 * the sink is not caught here.
 */
class TsvExporter {
   public:
    static constexpr std::string_view HEADER = "thread_id\trange_name\trange_start_nano\trange_end_nano\n";

    explicit TsvExporter(Sink& sink) : sink_(sink) {}

    void write_header() { sink_.write(HEADER); }

    /** Emits one row per range, all attributed to `tid`. */
    void write_thread(std::thread::id tid, const std::vector<ProfileScope>& ranges) {
        if (ranges.empty()) {
            return;
        }
        const std::string tid_text = format_thread_id(tid);
        for (const auto& range : ranges) {
            row_.clear();
            std::format_to(std::back_inserter(row_), "{}\t{}\t{}\t{}\n", tid_text, range.name, range.start_time, range.end_time);
            sink_.write(row_);
        }
    }

    void flush() { sink_.flush(); }

    /** Decimal rendering produced by operator<< on std::thread::id. */
    static auto format_thread_id(std::thread::id tid) -> std::string {
        std::ostringstream ostr;
        ostr << tid;
        return ostr.str();
    }

   private:
    Sink& sink_;
    std::string row_;
};

}  // namespace rprof
