#include "jsonl_resumable/json_record.hpp"

#include <simdjson.h>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <string_view>

namespace jr {

void append_json_string(std::string& out, std::string_view s) {
  out.push_back('"');
  for (char c : s) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '"':  out += "\\\""; break;
      case '\n': out += "\\n";  break;
      case '\r': out += "\\r";  break;
      case '\t': out += "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char tmp[8];
          std::snprintf(tmp, sizeof(tmp), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += tmp;
        } else {
          out.push_back(c);
        }
        break;
    }
  }
  out.push_back('"');
}

static std::string_view trim_ws(std::string_view s) {
  while (!s.empty() && (s.back()==' ' || s.back()=='\t' || s.back()=='\n' || s.back()=='\r'))
    s.remove_suffix(1);
  return s;
}

// Compact JSON for a nested value; walks every child so malformed content
// surfaces as simdjson_error.
static void append_json_value(std::string& out, simdjson::ondemand::value v) {
  switch (simdjson::ondemand::json_type(v.type())) {
    case simdjson::ondemand::json_type::object: {
      out.push_back('{');
      bool first = true;
      simdjson::ondemand::object obj = v.get_object();
      for (simdjson::ondemand::field f : obj) {
        if (!first) out.push_back(',');
        first = false;
        append_json_string(out, std::string_view(f.unescaped_key()));
        out.push_back(':');
        append_json_value(out, f.value());
      }
      out.push_back('}');
      break;
    }
    case simdjson::ondemand::json_type::array: {
      out.push_back('[');
      bool first = true;
      simdjson::ondemand::array arr = v.get_array();
      for (simdjson::ondemand::value el : arr) {
        if (!first) out.push_back(',');
        first = false;
        append_json_value(out, el);
      }
      out.push_back(']');
      break;
    }
    case simdjson::ondemand::json_type::number: {
      std::string_view tok = trim_ws(v.raw_json_token());
      simdjson::ondemand::number n = v.get_number();
      (void)n;
      out.append(tok);
      break;
    }
    case simdjson::ondemand::json_type::string:
      append_json_string(out, std::string_view(v.get_string()));
      break;
    case simdjson::ondemand::json_type::boolean:
      out += bool(v.get_bool()) ? "true" : "false";
      break;
    case simdjson::ondemand::json_type::null:
      if (!bool(v.is_null())) throw std::runtime_error("json: invalid literal");
      out += "null";
      break;
    default:
      throw std::runtime_error("json: unknown value type");
  }
}

// Field text for a member value: strings unescaped, null empty, rest JSON.
static std::string field_text(simdjson::ondemand::value v) {
  switch (simdjson::ondemand::json_type(v.type())) {
    case simdjson::ondemand::json_type::string:
      return std::string(std::string_view(v.get_string()));
    case simdjson::ondemand::json_type::null:
      if (!bool(v.is_null())) throw std::runtime_error("json: invalid literal");
      return std::string();
    default: {
      std::string out;
      append_json_value(out, v);
      return out;
    }
  }
}

Record parse_json_record(std::string_view line) {
  // thread-local scratch and parser
  thread_local simdjson::ondemand::parser parser;
  thread_local std::string scratch;

  scratch.assign(line.data(), line.size());
  scratch.resize(line.size() + simdjson::SIMDJSON_PADDING, '\0');
  simdjson::padded_string_view view(scratch.data(), line.size(), scratch.size());

  Record rec;
  try {
    simdjson::ondemand::document doc = parser.iterate(view);
    auto t = simdjson::ondemand::json_type(doc.type());

    if (t == simdjson::ondemand::json_type::object) {
      simdjson::ondemand::object obj = doc.get_object();
      for (simdjson::ondemand::field f : obj) {
        std::string key(std::string_view(f.unescaped_key()));
        rec.fields.emplace_back(std::move(key), field_text(f.value()));
      }
    } else {
      // Scalar or array root -> one unnamed field.
      std::string val;
      switch (t) {
        case simdjson::ondemand::json_type::string:
          val = std::string(std::string_view(doc.get_string()));
          break;
        case simdjson::ondemand::json_type::number: {
          std::string_view tok = trim_ws(doc.raw_json_token());
          simdjson::ondemand::number n = doc.get_number();
          (void)n;
          val = std::string(tok);
          break;
        }
        case simdjson::ondemand::json_type::boolean:
          val = bool(doc.get_bool()) ? "true" : "false";
          break;
        case simdjson::ondemand::json_type::null:
          if (!bool(doc.is_null())) throw std::runtime_error("json: invalid literal");
          break;
        case simdjson::ondemand::json_type::array: {
          val.push_back('[');
          bool first = true;
          simdjson::ondemand::array arr = doc.get_array();
          for (simdjson::ondemand::value el : arr) {
            if (!first) val.push_back(',');
            first = false;
            append_json_value(val, el);
          }
          val.push_back(']');
          break;
        }
        default:
          throw std::runtime_error("json: unknown value type");
      }
      rec.fields.emplace_back(std::string(), std::move(val));
    }

    if (!doc.at_end()) throw std::runtime_error("json: trailing content after value");
  } catch (const simdjson::simdjson_error& e) {
    throw std::runtime_error(std::string("json: ") + e.what());
  }
  return rec;
}

}
