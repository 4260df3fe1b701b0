#ifndef TVSORT_API_H
#define TVSORT_API_H

#ifdef __cplusplus
extern "C" {
#endif

#if defined(_WIN32)
    #ifdef TVSORT_EXPORTS
        #define TVSORT_API __declspec(dllexport)
    #else
        #define TVSORT_API __declspec(dllimport)
    #endif
#else
    #define TVSORT_API __attribute__((visibility("default")))
#endif

#include <stdint.h>
#include <stddef.h>

// Opaque handle to the ChannelSorter object
typedef void* tvsort_handle_t;

// Callback types
typedef void (*tvsort_log_callback_t)(const char* message);

/// Fetch callback - returns the playlist text for url
///
/// MEMORY CONTRACT:
/// - Returns: playlist text as C string (owned by the host), or NULL if
///   the download failed
/// - The returned string must remain valid until the next fetch callback
///   call or until tvsort_sorter_run returns, whichever comes first
/// - The library copies the text before requesting the next source
/// - The library will NOT call free() on the returned pointer
///
/// @param url Source URL from the source list
/// @param user_data Pointer passed to tvsort_sorter_set_fetch_callback
/// @return Playlist text, or NULL on failure
typedef const char* (*tvsort_fetch_callback_t)(const char* url, void* user_data);

// Run status codes
#define TVSORT_STATUS_SUCCESS        0
#define TVSORT_STATUS_NO_CONTENT    -1   // No source produced any channel
#define TVSORT_STATUS_NO_TEMPLATE   -2   // Template missing or empty
#define TVSORT_STATUS_WRITE_FAILED  -3   // Output could not be written
#define TVSORT_STATUS_INVALID_HANDLE -10

// Counts saturate at UINT32_MAX
struct TvsortStats {
    uint32_t matched_count;     // Channels placed under a template category
    uint32_t unmatched_count;   // Channels placed under the catch-all category
};

// API functions
TVSORT_API tvsort_handle_t tvsort_sorter_create();
TVSORT_API void tvsort_sorter_destroy(tvsort_handle_t handle);

TVSORT_API void tvsort_sorter_set_log_callback(tvsort_handle_t handle, tvsort_log_callback_t callback);

// Replace HTTP downloads with a host-provided fetcher. NULL restores HTTP.
TVSORT_API void tvsort_sorter_set_fetch_callback(tvsort_handle_t handle, tvsort_fetch_callback_t callback, void* user_data);

// Configuration (NULL arguments are ignored)
TVSORT_API void tvsort_sorter_set_source_list_path(tvsort_handle_t handle, const char* path);
TVSORT_API void tvsort_sorter_set_template_path(tvsort_handle_t handle, const char* path);
TVSORT_API void tvsort_sorter_set_mapping_path(tvsort_handle_t handle, const char* path);
TVSORT_API void tvsort_sorter_set_output_path(tvsort_handle_t handle, const char* path);
TVSORT_API void tvsort_sorter_set_default_source(tvsort_handle_t handle, const char* url);
TVSORT_API void tvsort_sorter_set_fetch_timeout(tvsort_handle_t handle, int timeout_seconds);

// Run the merge pipeline. Returns a TVSORT_STATUS_* code.
TVSORT_API int tvsort_sorter_run(tvsort_handle_t handle);

// Statistics of the last successful run (zeros otherwise)
TVSORT_API struct TvsortStats tvsort_sorter_get_stats(tvsort_handle_t handle);

// Static description of a status code
TVSORT_API const char* tvsort_status_string(int status);

#ifdef __cplusplus
}
#endif

#endif // TVSORT_API_H
