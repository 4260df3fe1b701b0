/**
 * test_tvsort_api.cpp
 *
 * Tests for the C API wrapper
 * Drives a full run through tvsort_sorter_* with a host fetch callback
 */

#include "tvsort/tvsort_api.h"
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

template<typename T, typename U>
bool AssertEqual(const T& actual, const U& expected, const std::string& msg) {
    if (actual != expected) {
        std::cerr << "FAIL: " << msg << std::endl;
        std::cerr << "  Expected: " << expected << std::endl;
        std::cerr << "  Got:      " << actual << std::endl;
        return false;
    }
    return true;
}

#define ASSERT_EQ(actual, expected, msg) \
    if (!AssertEqual(actual, expected, msg)) return false;

#define ASSERT_TRUE(condition, msg) \
    if (!(condition)) { \
        std::cerr << "FAIL: " << msg << std::endl; \
        std::cerr << "  Condition evaluated to false" << std::endl; \
        return false; \
    }

#define ASSERT_FALSE(condition, msg) \
    if (condition) { \
        std::cerr << "FAIL: " << msg << std::endl; \
        std::cerr << "  Condition evaluated to true (expected false)" << std::endl; \
        return false; \
    }

static fs::path ScratchDir() {
    static fs::path dir = [] {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        fs::path path = fs::temp_directory_path() / ("tvsort_api_test_" + std::to_string(stamp));
        fs::create_directories(path);
        return path;
    }();
    return dir;
}

static void WriteFile(const fs::path& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary);
    out << contents;
}

static std::string ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

// Host-side source table handed to the fetch callback as user_data
struct HostSources {
    std::map<std::string, std::string> bodies;
    int calls = 0;
};

static const char* host_fetch(const char* url, void* user_data) {
    auto* host = static_cast<HostSources*>(user_data);
    host->calls++;
    auto it = host->bodies.find(url);
    if (it == host->bodies.end()) {
        return nullptr;
    }
    return it->second.c_str();
}

// Host that renders each response into one reused buffer
struct ReusedBufferHost {
    std::string buffer;
    int calls = 0;
};

static const char* reused_buffer_fetch(const char* url, void* user_data) {
    auto* host = static_cast<ReusedBufferHost*>(user_data);
    host->calls++;
    host->buffer.assign(4096, 'x');  // Clobber the previous response
    host->buffer = "#EXTM3U\n#EXTINF:-1 group-title=\"Host\",Chan" + std::to_string(host->calls) +
                   "\n" + std::string(url) + "\n";
    return host->buffer.c_str();
}

static std::vector<std::string> g_log_lines;

static void host_log(const char* message) {
    g_log_lines.push_back(message);
}

// Test: full run through the C API
bool TestRunThroughApi() {
    std::cout << "Testing run through C API..." << std::endl;

    fs::path dir = ScratchDir() / "run";
    fs::create_directories(dir);
    WriteFile(dir / "sources.txt", "http://host.example/a.m3u\nhttp://host.example/missing.m3u\n");
    WriteFile(dir / "moban.txt", "新闻,#genre#\nCNN\n");
    WriteFile(dir / "map.txt", "CNN International,CNN\n");

    HostSources host;
    host.bodies["http://host.example/a.m3u"] =
        "#EXTM3U\n"
        "#EXTINF:-1 group-title=\"News\",CNN International\n"
        "http://a/cnn\n"
        "#EXTINF:-1 group-title=\"Misc\",Other\n"
        "http://a/other\n";

    tvsort_handle_t handle = tvsort_sorter_create();
    ASSERT_TRUE(handle != nullptr, "Handle created");

    g_log_lines.clear();
    tvsort_sorter_set_log_callback(handle, host_log);
    tvsort_sorter_set_fetch_callback(handle, host_fetch, &host);
    tvsort_sorter_set_source_list_path(handle, (dir / "sources.txt").string().c_str());
    tvsort_sorter_set_template_path(handle, (dir / "moban.txt").string().c_str());
    tvsort_sorter_set_mapping_path(handle, (dir / "map.txt").string().c_str());
    tvsort_sorter_set_output_path(handle, (dir / "out" / "live.txt").string().c_str());
    tvsort_sorter_set_output_path(handle, nullptr);  // ignored

    int status = tvsort_sorter_run(handle);
    ASSERT_EQ(status, TVSORT_STATUS_SUCCESS, "Run status");
    ASSERT_EQ(host.calls, 2, "Callback called for every source");
    ASSERT_FALSE(g_log_lines.empty(), "Log callback received messages");

    TvsortStats stats = tvsort_sorter_get_stats(handle);
    ASSERT_EQ(stats.matched_count, 1u, "Matched count");
    ASSERT_EQ(stats.unmatched_count, 1u, "Unmatched count");

    ASSERT_EQ(ReadFile(dir / "out" / "live.txt"),
              std::string("新闻,#genre#\nCNN,http://a/cnn\n\n其它,#genre#\nOther,http://a/other"),
              "Output document");

    tvsort_sorter_destroy(handle);

    std::cout << "  PASS" << std::endl;
    return true;
}

// Test: each response is copied before the host buffer is reused
bool TestReusedHostBuffer() {
    std::cout << "Testing reused host buffer..." << std::endl;

    fs::path dir = ScratchDir() / "reused";
    fs::create_directories(dir);
    WriteFile(dir / "sources.txt", "http://host.example/1.m3u\nhttp://host.example/2.m3u\nhttp://host.example/3.m3u\n");
    WriteFile(dir / "moban.txt", "Host,#genre#\nChan2\n");

    ReusedBufferHost host;

    tvsort_handle_t handle = tvsort_sorter_create();
    tvsort_sorter_set_fetch_callback(handle, reused_buffer_fetch, &host);
    tvsort_sorter_set_source_list_path(handle, (dir / "sources.txt").string().c_str());
    tvsort_sorter_set_template_path(handle, (dir / "moban.txt").string().c_str());
    tvsort_sorter_set_mapping_path(handle, (dir / "absent_map.txt").string().c_str());
    tvsort_sorter_set_output_path(handle, (dir / "live.txt").string().c_str());

    ASSERT_EQ(tvsort_sorter_run(handle), TVSORT_STATUS_SUCCESS, "Run status");
    ASSERT_EQ(host.calls, 3, "One call per source");

    ASSERT_EQ(ReadFile(dir / "live.txt"),
              std::string("Host,#genre#\n"
                          "Chan2,http://host.example/2.m3u\n"
                          "\n"
                          "其它,#genre#\n"
                          "Chan1,http://host.example/1.m3u\n"
                          "Chan3,http://host.example/3.m3u"),
              "Every response kept intact");

    tvsort_sorter_destroy(handle);

    std::cout << "  PASS" << std::endl;
    return true;
}

// Test: early stop statuses surface as codes
bool TestStatusCodes() {
    std::cout << "Testing status codes..." << std::endl;

    fs::path dir = ScratchDir() / "status";
    fs::create_directories(dir);

    HostSources host;  // Serves nothing

    tvsort_handle_t handle = tvsort_sorter_create();
    tvsort_sorter_set_fetch_callback(handle, host_fetch, &host);
    tvsort_sorter_set_source_list_path(handle, (dir / "absent_sources.txt").string().c_str());
    tvsort_sorter_set_default_source(handle, "http://host.example/default.m3u");
    tvsort_sorter_set_template_path(handle, (dir / "absent_moban.txt").string().c_str());
    tvsort_sorter_set_output_path(handle, (dir / "live.txt").string().c_str());

    ASSERT_EQ(tvsort_sorter_run(handle), TVSORT_STATUS_NO_CONTENT, "Nothing fetched");
    ASSERT_EQ(host.calls, 1, "Default source tried once");

    host.bodies["http://host.example/default.m3u"] = "#EXTM3U\n#EXTINF:-1,CNN\nhttp://d/cnn\n";
    ASSERT_EQ(tvsort_sorter_run(handle), TVSORT_STATUS_NO_TEMPLATE, "Template missing");
    ASSERT_FALSE(fs::exists(dir / "live.txt"), "No output on early stop");

    TvsortStats stats = tvsort_sorter_get_stats(handle);
    ASSERT_EQ(stats.matched_count, 0u, "No stats after early stop");

    tvsort_sorter_destroy(handle);

    std::cout << "  PASS" << std::endl;
    return true;
}

// Test: null handles are tolerated
bool TestNullHandle() {
    std::cout << "Testing null handle..." << std::endl;

    ASSERT_EQ(tvsort_sorter_run(nullptr), TVSORT_STATUS_INVALID_HANDLE, "Run on null handle");

    TvsortStats stats = tvsort_sorter_get_stats(nullptr);
    ASSERT_EQ(stats.matched_count, 0u, "Zero matched");
    ASSERT_EQ(stats.unmatched_count, 0u, "Zero unmatched");

    tvsort_sorter_set_template_path(nullptr, "x");
    tvsort_sorter_set_fetch_timeout(nullptr, 5);
    tvsort_sorter_destroy(nullptr);

    std::cout << "  PASS" << std::endl;
    return true;
}

// Test: status descriptions
bool TestStatusStrings() {
    std::cout << "Testing status strings..." << std::endl;

    ASSERT_EQ(std::string(tvsort_status_string(TVSORT_STATUS_SUCCESS)), std::string("success"), "Success");
    ASSERT_EQ(std::string(tvsort_status_string(TVSORT_STATUS_NO_TEMPLATE)),
              std::string("category template is empty"), "No template");
    ASSERT_EQ(std::string(tvsort_status_string(TVSORT_STATUS_INVALID_HANDLE)), std::string("invalid handle"),
              "Invalid handle");
    ASSERT_EQ(std::string(tvsort_status_string(42)), std::string("unknown status"), "Unknown code");

    std::cout << "  PASS" << std::endl;
    return true;
}

int main() {
    std::cout << "======================================" << std::endl;
    std::cout << " tvsort C API Tests" << std::endl;
    std::cout << "======================================" << std::endl << std::endl;

    int passed = 0;
    int total = 0;

    auto run_test = [&](bool (*test_func)(), const std::string& name) {
        total++;
        if (test_func()) {
            passed++;
        } else {
            std::cout << "  TEST FAILED: " << name << std::endl;
        }
        std::cout << std::endl;
    };

    run_test(TestRunThroughApi, "Run Through API");
    run_test(TestReusedHostBuffer, "Reused Host Buffer");
    run_test(TestStatusCodes, "Status Codes");
    run_test(TestNullHandle, "Null Handle");
    run_test(TestStatusStrings, "Status Strings");

    std::error_code ec;
    fs::remove_all(ScratchDir(), ec);

    std::cout << "======================================" << std::endl;
    std::cout << " Test Results: " << passed << "/" << total << " passed" << std::endl;
    std::cout << "======================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
