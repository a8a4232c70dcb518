#include "segmented_reader/manifest.hpp"
#include <sstream>
#include <cmath> // std::isfinite
#include <cstdio>

namespace sr {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
          o << buf;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string ManifestWriter::to_json(const ManifestPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"name\":";      esc(o, p.name); o << ",";
  o << "\"path\":";      esc(o, p.path); o << ",";
  o << "\"file_size\":"    << p.file_size    << ",";
  o << "\"size_hint\":"    << p.size_hint    << ",";
  o << "\"segment_size\":" << p.segment_size << ",";
  o << "\"complete\":"     << (p.complete ? "true" : "false") << ",";
  o << "\"error\":";       esc(o, p.error);       o << ",";
  o << "\"file_sha256\":"; esc(o, p.file_sha256); o << ",";

  o << "\"segments\":[";
  for (size_t i=0;i<p.segments.size();++i){
    if (i) o << ",";
    const auto& s = p.segments[i];
    o << "{"
      << "\"index\":"  << s.index  << ","
      << "\"offset\":" << s.offset << ","
      << "\"length\":" << s.length << ","
      << "\"sha256\":";
    esc(o, s.sha256);
    o << ",\"complete\":" << (s.complete ? "true" : "false") << "}";
  }
  o << "],";

  const auto& st = p.stats;
  o << "\"stats\":{";
  o << "\"segments\":"        << st.segments << ",";
  o << "\"bytes\":"           << st.bytes << ",";
  o << "\"pulls\":"           << st.pulls << ",";
  o << "\"polls\":"           << st.polls << ",";
  o << "\"largest_segment\":" << st.largest_segment << ",";
  o << "\"wall_time_ms\":"    << safe_num(st.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(st.throughput_mb_s) << ",";
  o << "\"stage_times\":[";
  for (size_t i=0;i<st.stages.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, st.stages[i].name);
    o << ",\"duration_ms\":" << safe_num(st.stages[i].duration_ms) << "}";
  }
  o << "]}";

  o << "}";
  return o.str();
}

}
