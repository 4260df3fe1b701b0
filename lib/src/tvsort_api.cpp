#include "tvsort/tvsort_api.h"
#include "ChannelSorter.h"

#include <cstdint>

using tvsort::ChannelSorter;
using tvsort::FetchResult;
using tvsort::RunStatus;
using tvsort::SorterConfig;

namespace {

template <typename Update>
void UpdateConfig(tvsort_handle_t handle, Update update) {
    if (!handle) return;
    auto* sorter = static_cast<ChannelSorter*>(handle);
    SorterConfig config = sorter->GetConfig();
    update(config);
    sorter->SetConfig(config);
}

uint32_t ClampCount(size_t count) {
    return count > UINT32_MAX ? UINT32_MAX : static_cast<uint32_t>(count);
}

} // namespace

extern "C" {

TVSORT_API tvsort_handle_t tvsort_sorter_create() {
    return new ChannelSorter();
}

TVSORT_API void tvsort_sorter_destroy(tvsort_handle_t handle) {
    delete static_cast<ChannelSorter*>(handle);
}

TVSORT_API void tvsort_sorter_set_log_callback(tvsort_handle_t handle, tvsort_log_callback_t callback) {
    if (!handle) return;
    auto* sorter = static_cast<ChannelSorter*>(handle);
    if (!callback) {
        sorter->SetLogCallback(nullptr);
        return;
    }
    sorter->SetLogCallback([callback](const std::string& message) {
        callback(message.c_str());
    });
}

TVSORT_API void tvsort_sorter_set_fetch_callback(tvsort_handle_t handle, tvsort_fetch_callback_t callback, void* user_data) {
    if (!handle) return;
    auto* sorter = static_cast<ChannelSorter*>(handle);
    if (!callback) {
        sorter->SetFetchFunction(nullptr);
        return;
    }
    sorter->SetFetchFunction([callback, user_data](const std::string& url) {
        const char* body = callback(url.c_str(), user_data);
        if (!body) {
            return FetchResult::Failure("fetch callback returned no content");
        }
        FetchResult result;
        result.success = true;
        result.status_code = 200;
        result.body = body;
        return result;
    });
}

TVSORT_API void tvsort_sorter_set_source_list_path(tvsort_handle_t handle, const char* path) {
    if (!path) return;
    UpdateConfig(handle, [path](SorterConfig& config) { config.source_list_path = path; });
}

TVSORT_API void tvsort_sorter_set_template_path(tvsort_handle_t handle, const char* path) {
    if (!path) return;
    UpdateConfig(handle, [path](SorterConfig& config) { config.template_path = path; });
}

TVSORT_API void tvsort_sorter_set_mapping_path(tvsort_handle_t handle, const char* path) {
    if (!path) return;
    UpdateConfig(handle, [path](SorterConfig& config) { config.mapping_path = path; });
}

TVSORT_API void tvsort_sorter_set_output_path(tvsort_handle_t handle, const char* path) {
    if (!path) return;
    UpdateConfig(handle, [path](SorterConfig& config) { config.output_path = path; });
}

TVSORT_API void tvsort_sorter_set_default_source(tvsort_handle_t handle, const char* url) {
    if (!url) return;
    UpdateConfig(handle, [url](SorterConfig& config) { config.default_source_url = url; });
}

TVSORT_API void tvsort_sorter_set_fetch_timeout(tvsort_handle_t handle, int timeout_seconds) {
    UpdateConfig(handle, [timeout_seconds](SorterConfig& config) {
        config.fetch_timeout_seconds = timeout_seconds;
    });
}

TVSORT_API int tvsort_sorter_run(tvsort_handle_t handle) {
    if (!handle) {
        return TVSORT_STATUS_INVALID_HANDLE;
    }
    return static_cast<int>(static_cast<ChannelSorter*>(handle)->Run());
}

TVSORT_API TvsortStats tvsort_sorter_get_stats(tvsort_handle_t handle) {
    TvsortStats stats = {0, 0};
    if (handle) {
        const auto& last = static_cast<ChannelSorter*>(handle)->GetLastStats();
        stats.matched_count = ClampCount(last.matched);
        stats.unmatched_count = ClampCount(last.unmatched);
    }
    return stats;
}

TVSORT_API const char* tvsort_status_string(int status) {
    switch (status) {
        case TVSORT_STATUS_SUCCESS:
            return tvsort::RunStatusToString(RunStatus::Success);
        case TVSORT_STATUS_NO_CONTENT:
            return tvsort::RunStatusToString(RunStatus::NoContent);
        case TVSORT_STATUS_NO_TEMPLATE:
            return tvsort::RunStatusToString(RunStatus::NoTemplate);
        case TVSORT_STATUS_WRITE_FAILED:
            return tvsort::RunStatusToString(RunStatus::WriteFailed);
        case TVSORT_STATUS_INVALID_HANDLE:
            return "invalid handle";
        default:
            return "unknown status";
    }
}

} // extern "C"
