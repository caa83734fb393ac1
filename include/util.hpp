#pragma once
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

std::string trim(std::string s);
std::string to_lower(std::string s);
std::vector<std::string> split(const std::string &line);

// "R3"
std::string resource_label(uint32_t resource_id);
// "1, 2, 3"
std::string join_ids(const std::vector<uint32_t> &ids, const std::string &prefix = "");

std::string merge_columns(const std::string &left, const std::string &right,
                          size_t width, const std::string &sep);


//#define PROCSIM_DEBUG
#define PROCSIM_DEBUG_ENGINE false
#define PROCSIM_DEBUG_LOADER false

#ifdef PROCSIM_DEBUG
    #warning "Debug-printing is active"
    #define PROCSIM_DEBUG_PRINT(condition, msg, ...) \
      if (condition) \
        printf("[%s:%s():%d] " msg "\n", __FILE__, __func__, __LINE__, ##__VA_ARGS__);
#else
    #define PROCSIM_DEBUG_PRINT(condition, msg, ...)
#endif
