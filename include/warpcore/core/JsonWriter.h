#pragma once

#include <cmath>
#include <ostream>
#include <string_view>
#include <vector>

namespace warpcore::core {

// Streaming JSON writer with string escaping and optional pretty printing.
// Used by warpcore_sandbox to dump session state. Non-finite numbers (an
// undefined ETA, for example) are written as null.
class JsonWriter {
public:
  explicit JsonWriter(std::ostream& out, bool pretty = true, int indentSpaces = 2)
      : out_(out), pretty_(pretty), indentSpaces_(indentSpaces) {}

  void beginObject() { open('{'); }
  void endObject() { close('}'); }
  void beginArray() { open('['); }
  void endArray() { close(']'); }

  void key(std::string_view k) {
    separate();
    writeString(k);
    out_ << (pretty_ ? ": " : ":");
    pendingKey_ = true;
  }

  void value(std::string_view s) { separate(); writeString(s); }
  void value(const char* s) {
    if (!s) { nullValue(); return; }
    value(std::string_view(s));
  }
  void value(double v) {
    if (!std::isfinite(v)) { nullValue(); return; }
    separate();
    out_ << v;
  }
  void value(long long v) { separate(); out_ << v; }
  void value(unsigned long long v) { separate(); out_ << v; }
  void value(int v) { value(static_cast<long long>(v)); }
  void value(bool v) { separate(); out_ << (v ? "true" : "false"); }
  void nullValue() { separate(); out_ << "null"; }

  // key + value in one call
  template <typename T>
  void field(std::string_view k, const T& v) {
    key(k);
    value(v);
  }

  // [x, y, z]
  void triple(std::string_view k, double x, double y, double z) {
    key(k);
    beginArray();
    value(x); value(y); value(z);
    endArray();
  }

private:
  void open(char c) {
    separate();
    out_ << c;
    firstInScope_.push_back(true);
  }

  void close(char c) {
    if (firstInScope_.empty()) return;
    const bool empty = firstInScope_.back();
    firstInScope_.pop_back();
    if (pretty_ && !empty) {
      out_ << "\n";
      indent();
    }
    out_ << c;
  }

  // Emits the comma/newline/indent that precedes a value or key.
  void separate() {
    if (pendingKey_) {
      pendingKey_ = false;
      return;
    }
    if (firstInScope_.empty()) return;
    if (!firstInScope_.back()) out_ << ',';
    firstInScope_.back() = false;
    if (pretty_) {
      out_ << "\n";
      indent();
    }
  }

  void indent() {
    const auto n = firstInScope_.size() * static_cast<std::size_t>(indentSpaces_);
    for (std::size_t i = 0; i < n; ++i) out_ << ' ';
  }

  void writeString(std::string_view s) {
    static const char* hex = "0123456789abcdef";
    out_ << '"';
    for (char c : s) {
      switch (c) {
        case '"':  out_ << "\\\""; break;
        case '\\': out_ << "\\\\"; break;
        case '\n': out_ << "\\n"; break;
        case '\r': out_ << "\\r"; break;
        case '\t': out_ << "\\t"; break;
        default: {
          const auto uc = static_cast<unsigned char>(c);
          if (uc < 0x20) {
            out_ << "\\u00" << hex[(uc >> 4) & 0xF] << hex[uc & 0xF];
          } else {
            out_ << c;
          }
        }
      }
    }
    out_ << '"';
  }

  std::ostream& out_;
  bool pretty_{true};
  int indentSpaces_{2};
  bool pendingKey_{false};
  std::vector<bool> firstInScope_;
};

} // namespace warpcore::core
