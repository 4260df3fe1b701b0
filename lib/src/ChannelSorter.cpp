#include "ChannelSorter.h"
#include "ConfigLoader.h"
#include "ContentAggregator.h"
#include "TemplateClassifier.h"
#include "playlist/PlaylistParserFactory.h"
#include "playlist/PlaylistUtils.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace tvsort {

const char* RunStatusToString(RunStatus status) {
    switch (status) {
        case RunStatus::Success:
            return "success";
        case RunStatus::NoContent:
            return "no content fetched from any source";
        case RunStatus::NoTemplate:
            return "category template is empty";
        case RunStatus::WriteFailed:
            return "failed to write output";
    }
    return "unknown";
}

ChannelSorter::ChannelSorter(SorterConfig config)
    : config_(std::move(config)) {
}

ChannelSorter::~ChannelSorter() = default;

void ChannelSorter::SetLogCallback(LogCallback callback) {
    log_callback_ = callback;
    if (http_client_) {
        http_client_->SetLogCallback(log_callback_);
    }
}

void ChannelSorter::SetFetchFunction(FetchFunction fetch) {
    fetch_ = std::move(fetch);
}

void ChannelSorter::SetConfig(const SorterConfig& config) {
    config_ = config;
    // Timeout and user agent are baked into the client
    http_client_.reset();
}

RunStatus ChannelSorter::Run() {
    last_stats_ = ClassificationStats();
    ConfigLoader loader(log_callback_);

    std::vector<std::string> urls = loader.LoadSourceUrls(config_.source_list_path, config_.default_source_url);
    Log("Loaded " + std::to_string(urls.size()) + " source URLs");

    NameMapping mapping = loader.LoadChannelMapping(config_.mapping_path);

    // Sequential on purpose: aggregation order must follow source-list order
    std::vector<std::vector<ChannelRecord>> per_source;
    per_source.reserve(urls.size());
    for (const auto& url : urls) {
        per_source.push_back(FetchAndParse(url, mapping));
    }

    std::vector<ChannelRecord> records = ContentAggregator::Aggregate(per_source);
    if (records.empty()) {
        Log("Error: no valid content fetched from any source");
        return RunStatus::NoContent;
    }
    Log("Aggregated " + std::to_string(records.size()) + " channels from " +
        std::to_string(urls.size()) + " sources");

    CategoryTemplate category_template = loader.LoadCategoryTemplate(config_.template_path);
    if (category_template.empty()) {
        Log("Error: category template is empty, check " + config_.template_path);
        return RunStatus::NoTemplate;
    }

    ClassifiedDocument document = TemplateClassifier::Classify(category_template, records);
    std::string text = TemplateClassifier::Render(document);

    if (!WriteOutput(text)) {
        return RunStatus::WriteFailed;
    }

    last_stats_ = TemplateClassifier::ComputeStats(document);
    Log("Merge complete, saved to " + config_.output_path);
    Log("Stats: " + std::to_string(last_stats_.matched) + " matched channels, " +
        std::to_string(last_stats_.unmatched) + " unclassified channels");
    return RunStatus::Success;
}

std::vector<ChannelRecord> ChannelSorter::FetchAndParse(const std::string& url, const NameMapping& mapping) {
    FetchResult result = Fetch(url);
    if (!result.success) {
        Log("Fetch failed for " + url + ": " + result.error);
        return {};
    }

    const std::string body = strip_utf8_bom(result.body);
    PlaylistFormat format = PlaylistParserFactory::DetectFormat(body);
    auto parser = PlaylistParserFactory::CreateParser(format);
    std::vector<ChannelRecord> records = parser->Parse(body, mapping);

    Log("Parsed " + std::to_string(records.size()) + " channels (" +
        PlaylistFormatName(format) + ") from " + url);
    return records;
}

bool ChannelSorter::WriteOutput(const std::string& text) {
    namespace fs = std::filesystem;

    fs::path output_path(config_.output_path);
    std::error_code ec;
    if (output_path.has_parent_path()) {
        fs::create_directories(output_path.parent_path(), ec);
        if (ec) {
            Log("Error: cannot create directory " + output_path.parent_path().string() +
                ": " + ec.message());
            return false;
        }
    }

    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        Log("Error: cannot open " + config_.output_path + " for writing");
        return false;
    }

    out << text;
    out.flush();
    if (!out) {
        Log("Error: failed writing " + config_.output_path);
        return false;
    }

    return true;
}

FetchResult ChannelSorter::Fetch(const std::string& url) {
    if (fetch_) {
        try {
            return fetch_(url);
        } catch (const std::exception& e) {
            return FetchResult::Failure(e.what());
        }
    }

    if (!http_client_) {
        HttpClient::ClientConfig client_config;
        client_config.timeout_seconds = config_.fetch_timeout_seconds;
        client_config.user_agent = config_.user_agent;
        try {
            http_client_ = std::make_unique<HttpClient>(client_config);
        } catch (const std::exception& e) {
            return FetchResult::Failure(e.what());
        }
        http_client_->SetLogCallback(log_callback_);
    }

    return http_client_->FetchText(url);
}

void ChannelSorter::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_("[ChannelSorter] " + message);
    }
}

} // namespace tvsort
