#pragma once

#include <fstream>
#include <string>
#include <vector>

#include "../comparator/divergence.h"
#include "run_summary.h"

namespace Crosscheck {

/**
 * Receives finalized blocks in strictly increasing height order,
 * then exactly one summary.
 */
class IReportSink {
public:
    virtual ~IReportSink() = default;

    virtual void OnBlock(const BlockResult& result) = 0;
    virtual void OnFinish(const RunSummary& summary) = 0;
};

// Renders divergences to glog: WARNING per divergence, VLOG(1) per clean block.
class LogReportSink : public IReportSink {
public:
    void OnBlock(const BlockResult& result) override;
    void OnFinish(const RunSummary& summary) override;
};

/**
 * One JSON object per finalized block, plus a closing
 * {"type":"summary", ...} line.
 */
class JsonLinesReportSink : public IReportSink {
public:
    explicit JsonLinesReportSink(std::string path);

    // Opens the file for appending; false if it cannot be opened.
    bool Open(std::string& error);

    void OnBlock(const BlockResult& result) override;
    void OnFinish(const RunSummary& summary) override;

private:
    void WriteLine(const std::string& line);

    std::string path_;
    std::ofstream out_;
    bool failed_ = false;
};

class TeeReportSink : public IReportSink {
public:
    void Add(IReportSink* sink) { sinks_.push_back(sink); }

    void OnBlock(const BlockResult& result) override {
        for (auto* sink : sinks_) sink->OnBlock(result);
    }
    void OnFinish(const RunSummary& summary) override {
        for (auto* sink : sinks_) sink->OnFinish(summary);
    }

private:
    std::vector<IReportSink*> sinks_;
};

} // namespace Crosscheck
