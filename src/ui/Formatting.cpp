#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include "util/Procfs.hpp"
#include <algorithm>
#include <clocale>
#include <cstdio>
#include <ctime>
#include <cstdlib>
#include <cwchar>
#include <langinfo.h>

namespace tasktop::ui {

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

static wchar_t u8_decode(const std::string& s, size_t i, int len) {
  unsigned char c = static_cast<unsigned char>(s[i]);
  if (len == 1) return c;
  wchar_t wc = (len == 2) ? (c & 0x1F) : (len == 3) ? (c & 0x0F) : (c & 0x07);
  for (int k = 1; k < len; ++k) wc = (wc << 6) | (static_cast<unsigned char>(s[i + k]) & 0x3F);
  return wc;
}

static size_t skip_csi(const std::string& s, size_t i) {
  i += 2;
  while (i < s.size() && (s[i] < '@' || s[i] > '~')) i++;
  if (i < s.size()) i++; // final byte
  return i;
}

static bool at_csi(const std::string& s, size_t i) {
  return s[i] == '\x1B' && i + 1 < s.size() && s[i + 1] == '[';
}

// Wide glyphs take two columns once the locale knows about them
static int glyph_cols(const std::string& s, size_t i, int len) {
  if (len == 1) return 1;
  int w = ::wcwidth(u8_decode(s, i, len));
  return w > 0 ? w : 1;
}

int display_cols(const std::string& s){
  int cols = 0;
  for (size_t i = 0; i < s.size();) {
    if (at_csi(s, i)) { i = skip_csi(s, i); continue; }
    int len = u8_len(static_cast<unsigned char>(s[i]));
    if (i + static_cast<size_t>(len) > s.size()) len = 1;
    cols += glyph_cols(s, i, len);
    i += len;
  }
  return cols;
}

std::string take_cols(const std::string& s, int cols){
  if (cols <= 0) return std::string();
  std::string out;
  out.reserve(s.size());
  int seen = 0;
  size_t i = 0;
  while (i < s.size()) {
    if (at_csi(s, i)) {
      size_t start = i;
      i = skip_csi(s, i);
      out.append(s, start, i - start);
      continue;
    }
    int len = u8_len(static_cast<unsigned char>(s[i]));
    if (i + static_cast<size_t>(len) > s.size()) len = 1;
    int w = glyph_cols(s, i, len);
    if (seen + w > cols) break;
    out.append(s, i, len);
    i += len;
    seen += w;
  }
  return out;
}

std::string trunc_pad(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return s + std::string(w - cols, ' ');
  if (w <= 1) return take_cols(s, w);
  std::string t = take_cols(s, w - 1);
  t += use_unicode() ? "…" : ".";
  int tc = display_cols(t);
  return tc < w ? t + std::string(w - tc, ' ') : t;
}

std::string lr_align(int iw, const std::string& left, const std::string& right){
  if (iw <= 0) return std::string();
  int rvis = display_cols(right);
  int tlw = std::max(0, iw - rvis - 1);
  std::string l = trunc_pad(left, tlw);
  int space = std::max(0, iw - display_cols(l) - rvis);
  return l + std::string(space, ' ') + right;
}

std::string format_fixed(double v, int decimals) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
  return buf;
}

std::string meter(double pct, int w) {
  if (w < 3) return std::string();
  const int inner = w - 2;
  int fill = static_cast<int>(std::clamp(pct, 0.0, 100.0) / 100.0 * inner + 0.5);
  return "[" + std::string(fill, '|') + std::string(inner - fill, ' ') + "]";
}

std::string format_kb(uint64_t kb) {
  const double v = static_cast<double>(kb);
  if (kb >= 1024ull * 1024ull) return format_fixed(v / (1024.0 * 1024.0), 1) + "G";
  if (kb >= 1024ull) return format_fixed(v / 1024.0, 1) + "M";
  return std::to_string(kb) + "K";
}

bool prefer_12h_clock_from_locale() {
  static bool inited = false;
  if (!inited) {
    std::setlocale(LC_TIME, "");
    inited = true;
  }
  const char* tfmt = nl_langinfo(T_FMT);
  if (tfmt && *tfmt) {
    std::string f = tfmt;
    if (f.find("%I") != std::string::npos || f.find("%p") != std::string::npos) return true;
  }
  return false;
}

std::string format_time_now(bool prefer12h) {
  std::time_t t = std::time(nullptr);
  std::tm lt{};
  localtime_r(&t, &lt);
  char buf[64];
  const char* fmt = prefer12h ? "%I:%M:%S %p" : "%H:%M:%S";
  if (std::strftime(buf, sizeof(buf), fmt, &lt) == 0) return std::string();
  if (prefer12h && buf[0] == '0') return std::string(buf + 1);
  return std::string(buf);
}

std::string read_hostname() {
  auto txt = tasktop::util::read_file_string("/proc/sys/kernel/hostname");
  if (!txt) return "unknown";
  std::string host = *txt;
  while (!host.empty() && (host.back() == '\n' || host.back() == '\r' || host.back() == ' '))
    host.pop_back();
  return host.empty() ? "unknown" : host;
}

std::string read_uptime_formatted() {
  auto txt = tasktop::util::read_file_string("/proc/uptime");
  if (!txt) return "0d 00:00";
  const uint64_t total = static_cast<uint64_t>(std::strtod(txt->c_str(), nullptr));
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%llud %02llu:%02llu",
                static_cast<unsigned long long>(total / 86400),
                static_cast<unsigned long long>((total % 86400) / 3600),
                static_cast<unsigned long long>((total % 3600) / 60));
  return buf;
}

} // namespace tasktop::ui
