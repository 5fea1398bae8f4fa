#include "report_sink.h"

#include <iomanip>
#include <sstream>

#include <glog/logging.h>
#include <json/json.h>

namespace Crosscheck {

namespace {

constexpr size_t kMaxLoggedRanges = 20;

std::string ToLine(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

Json::Value EncodeDivergence(const DivergenceEntry& entry) {
    Json::Value out(Json::objectValue);
    out["kind"] = DivergenceKindName(entry.kind);
    out["key"] = entry.key;
    if (!entry.detail.empty()) {
        out["detail"] = entry.detail;
    }
    if (!entry.fields.empty()) {
        Json::Value fields(Json::arrayValue);
        for (const auto& field : entry.fields) {
            Json::Value f(Json::objectValue);
            f["field"] = field.field;
            f["primary"] = field.primary;
            f["secondary"] = field.secondary;
            fields.append(f);
        }
        out["fields"] = fields;
    }
    return out;
}

} // namespace

void LogReportSink::OnBlock(const BlockResult& result) {
    switch (result.status) {
        case BlockStatus::OK:
            if (result.divergences.empty()) {
                VLOG(1) << "Block " << result.height << " matched";
                return;
            }
            LOG(WARNING) << "Discrepancies found in block " << result.height << " ("
                         << result.divergences.size() << ")";
            for (const auto& entry : result.divergences) {
                LOG(WARNING) << "  " << DescribeDivergence(entry);
            }
            return;
        case BlockStatus::FETCH_FAILED:
            LOG(WARNING) << "Block " << result.height << " unverified: " << result.error;
            return;
        case BlockStatus::FATAL:
            LOG(ERROR) << "Block " << result.height << " could not be compared: " << result.error;
            return;
    }
}

void LogReportSink::OnFinish(const RunSummary& summary) {
    std::ostringstream rate;
    rate << std::fixed << std::setprecision(4)
         << (summary.blocks_finalized ? summary.elapsed_seconds / summary.blocks_finalized : 0.0);

    LOG(INFO) << "Run " << summary.final_state << ": blocks " << summary.start_height << " to "
              << summary.end_height << ", " << summary.blocks_finalized << " finalized in "
              << summary.elapsed_seconds << "s (" << rate.str() << " seconds/block)";

    if (summary.DivergenceFound()) {
        LOG(WARNING) << "Divergences found: " << summary.total_divergences << " in "
                     << summary.blocks_diverged << " blocks";
        for (const auto& [kind, count] : summary.divergences_by_kind) {
            LOG(WARNING) << "  " << DivergenceKindName(kind) << ": " << count;
        }
        for (const auto& [bucket, count] : summary.divergences_by_bucket) {
            LOG(WARNING) << "  heights " << bucket << "-" << bucket + summary.bucket_size - 1 << ": " << count;
        }
    } else {
        LOG(INFO) << "No divergences in verified blocks";
    }

    if (summary.VerificationIncomplete()) {
        const auto& ranges = summary.unverified_ranges;
        std::ostringstream heights;
        for (size_t i = 0; i < ranges.size() && i < kMaxLoggedRanges; ++i) {
            heights << (i ? ", " : "") << ranges[i].first;
            if (ranges[i].last != ranges[i].first) {
                heights << "-" << ranges[i].last;
            }
        }
        if (ranges.size() > kMaxLoggedRanges) {
            heights << ", ...";
        }
        LOG(WARNING) << "Verification incomplete: " << summary.unverified_blocks
                     << " heights unverified [" << heights.str() << "]";
    }
}

JsonLinesReportSink::JsonLinesReportSink(std::string path) : path_(std::move(path)) {}

bool JsonLinesReportSink::Open(std::string& error) {
    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_.is_open()) {
        error = "Failed to open report file " + path_;
        return false;
    }
    return true;
}

void JsonLinesReportSink::WriteLine(const std::string& line) {
    if (failed_) {
        return;
    }
    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        // Report loss does not stop reconciliation; the log sink still has it.
        LOG(ERROR) << "Failed to write report file " << path_ << ", disabling JSON report";
        failed_ = true;
    }
}

void JsonLinesReportSink::OnBlock(const BlockResult& result) {
    Json::Value line(Json::objectValue);
    line["type"] = "block";
    line["height"] = Json::UInt64(result.height);
    line["status"] = BlockStatusName(result.status);
    if (!result.error.empty()) {
        line["error"] = result.error;
    }
    Json::Value divergences(Json::arrayValue);
    for (const auto& entry : result.divergences) {
        divergences.append(EncodeDivergence(entry));
    }
    line["divergences"] = divergences;
    WriteLine(ToLine(line));
}

void JsonLinesReportSink::OnFinish(const RunSummary& summary) {
    Json::Value line(Json::objectValue);
    line["type"] = "summary";
    line["state"] = summary.final_state;
    line["start_height"] = Json::UInt64(summary.start_height);
    line["end_height"] = Json::UInt64(summary.end_height);
    line["blocks_finalized"] = Json::UInt64(summary.blocks_finalized);
    line["blocks_ok"] = Json::UInt64(summary.blocks_ok);
    line["blocks_diverged"] = Json::UInt64(summary.blocks_diverged);
    line["total_divergences"] = Json::UInt64(summary.total_divergences);
    line["divergence_found"] = summary.DivergenceFound();
    line["verification_incomplete"] = summary.VerificationIncomplete();
    line["elapsed_seconds"] = summary.elapsed_seconds;

    Json::Value by_kind(Json::objectValue);
    for (const auto& [kind, count] : summary.divergences_by_kind) {
        by_kind[DivergenceKindName(kind)] = Json::UInt64(count);
    }
    line["divergences_by_kind"] = by_kind;

    Json::Value by_bucket(Json::objectValue);
    for (const auto& [bucket, count] : summary.divergences_by_bucket) {
        by_bucket[std::to_string(bucket)] = Json::UInt64(count);
    }
    line["divergences_by_bucket"] = by_bucket;
    line["bucket_size"] = Json::UInt64(summary.bucket_size);

    line["unverified_blocks"] = Json::UInt64(summary.unverified_blocks);
    Json::Value unverified(Json::arrayValue);
    for (const auto& range : summary.unverified_ranges) {
        Json::Value pair(Json::arrayValue);
        pair.append(Json::UInt64(range.first));
        pair.append(Json::UInt64(range.last));
        unverified.append(pair);
    }
    line["unverified_ranges"] = unverified;
    WriteLine(ToLine(line));
}

} // namespace Crosscheck
