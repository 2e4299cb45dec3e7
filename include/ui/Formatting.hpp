#pragma once

#include <cstdint>
#include <string>

namespace tasktop::ui {

// UTF-8 text width; escape sequences count as zero columns
int u8_len(unsigned char c);
int display_cols(const std::string& s);
std::string take_cols(const std::string& s, int cols);

// Left-aligned, truncated with an ellipsis when too long
std::string trunc_pad(const std::string& s, int w);
std::string lr_align(int iw, const std::string& left, const std::string& right);

std::string format_fixed(double v, int decimals);
// "[|||||     ]" style meter, w columns including the brackets
std::string meter(double pct, int w);
// 1.2G / 512.0M / 800K from a kB count
std::string format_kb(uint64_t kb);

bool prefer_12h_clock_from_locale();
std::string format_time_now(bool prefer12h);
std::string read_hostname();
std::string read_uptime_formatted();

} // namespace tasktop::ui
