#pragma once

#include <string>
#include <vector>
#include <functional>
#include <memory>

#include "ChannelTypes.h"
#include "protocols/http/HttpClient.h"

namespace tvsort {

// Values match the TVSORT_STATUS_* codes of the C API
enum class RunStatus {
    Success = 0,
    NoContent = -1,    // No source produced any channel
    NoTemplate = -2,   // Template missing or without categories
    WriteFailed = -3   // Output could not be written
};

const char* RunStatusToString(RunStatus status);

struct SorterConfig {
    std::string source_list_path = "TV/sources.txt";
    std::string template_path = "TV/moban.txt";
    std::string mapping_path = "TV/channel_mapping.txt";
    std::string output_path = "TV/live.txt";
    std::string default_source_url = "https://live.fanmingming.com/tv/m3u/ipv6.m3u";
    int fetch_timeout_seconds = 10;
    std::string user_agent = "tvsort/1.0";
};

/**
 * ChannelSorter
 *
 * Runs the full merge pipeline:
 *   source list -> fetch + parse each source (in order) -> aggregate
 *   -> classify against the template -> write the output document
 *
 * A source that fails to download contributes nothing. The run stops
 * early, without writing, when no source produced a channel or when the
 * template is empty.
 */
class ChannelSorter {
public:
    using LogCallback = std::function<void(const std::string& message)>;
    using FetchFunction = std::function<FetchResult(const std::string& url)>;

    explicit ChannelSorter(SorterConfig config = SorterConfig());
    ~ChannelSorter();

    ChannelSorter(const ChannelSorter&) = delete;
    ChannelSorter& operator=(const ChannelSorter&) = delete;

    void SetLogCallback(LogCallback callback);

    /**
     * Replace the HTTP download step (e.g. with an in-memory source).
     * Passing nullptr restores the libcurl client.
     */
    void SetFetchFunction(FetchFunction fetch);

    void SetConfig(const SorterConfig& config);
    const SorterConfig& GetConfig() const { return config_; }

    /**
     * Execute one run
     * @return Run status; statistics of the last successful run are
     *         available from GetLastStats()
     */
    RunStatus Run();

    /**
     * Download and parse one source
     * @param url Source URL
     * @param mapping Channel name mapping
     * @return Parsed records, empty when the download failed
     */
    std::vector<ChannelRecord> FetchAndParse(const std::string& url, const NameMapping& mapping);

    /**
     * Write the document to config.output_path, creating its directory
     * @return true on success
     */
    bool WriteOutput(const std::string& text);

    const ClassificationStats& GetLastStats() const { return last_stats_; }

private:
    FetchResult Fetch(const std::string& url);
    void Log(const std::string& message);

    SorterConfig config_;
    LogCallback log_callback_;
    FetchFunction fetch_;
    std::unique_ptr<HttpClient> http_client_;  // Created on first default fetch
    ClassificationStats last_stats_;
};

} // namespace tvsort
