// Repository: Stagegate
// Component: Staged Request implementation (JSONL codec, id generation)
// Copyright (c) 2026 Stagegate

#include "stagegate/staging/StagedRequest.hpp"

#include <cctype>
#include <cstdio>
#include <random>
#include <sstream>

namespace stagegate::staging {

namespace {

std::string JsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    if (c == '"') out += "\\\"";
    else if (c == '\\') out += "\\\\";
    else if (c == '\n') out += "\\n";
    else if (c == '\r') out += "\\r";
    else if (c == '\t') out += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
      out += buf;
    } else {
      out += c;
    }
  }
  return out;
}

void WriteNullableString(std::ostringstream& o, const char* key,
                         const std::optional<std::string>& value) {
  o << ",\"" << key << "\":";
  if (value.has_value())
    o << "\"" << JsonEscape(*value) << "\"";
  else
    o << "null";
}

// Reads a quoted string starting at line[start] == '"'. Sets *end past the
// closing quote.
bool ReadQuoted(const std::string& line, size_t start, size_t* end, std::string* out) {
  if (start >= line.size() || line[start] != '"') return false;
  out->clear();
  for (size_t i = start + 1; i < line.size(); ++i) {
    if (line[i] == '\\' && i + 1 < line.size()) {
      char n = line[i + 1];
      if (n == '"')  { *out += '"';  i++; continue; }
      if (n == '\\') { *out += '\\'; i++; continue; }
      if (n == '/')  { *out += '/';  i++; continue; }
      if (n == 'n')  { *out += '\n'; i++; continue; }
      if (n == 'r')  { *out += '\r'; i++; continue; }
      if (n == 't')  { *out += '\t'; i++; continue; }
      if (n == 'u' && i + 5 < line.size()) {
        unsigned v = 0;
        for (size_t k = i + 2; k < i + 6; ++k) {
          if (!std::isxdigit(static_cast<unsigned char>(line[k]))) return false;
          v = v * 16 + static_cast<unsigned>(std::stoi(std::string(1, line[k]), nullptr, 16));
        }
        if (v > 0x7F) return false;  // Writer only escapes control characters.
        *out += static_cast<char>(v);
        i += 5;
        continue;
      }
      return false;
    }
    if (line[i] == '"') {
      *end = i + 1;
      return true;
    }
    *out += line[i];
  }
  return false;
}

// Locates "key": at or after *pos and returns the index of the value.
bool FindValue(const std::string& line, const std::string& key, size_t pos, size_t* value_start) {
  std::string search = "\"" + key + "\":";
  size_t start = line.find(search, pos);
  if (start == std::string::npos) return false;
  start += search.size();
  while (start < line.size() && line[start] == ' ') ++start;
  *value_start = start;
  return start < line.size();
}

bool ParseJsonStringValue(const std::string& line, const std::string& key,
                          size_t* pos, std::string* out) {
  size_t start;
  if (!FindValue(line, key, *pos, &start)) return false;
  return ReadQuoted(line, start, pos, out);
}

bool ParseJsonNullableStringValue(const std::string& line, const std::string& key,
                                  size_t* pos, std::optional<std::string>* out) {
  size_t start;
  if (!FindValue(line, key, *pos, &start)) return false;
  if (line.compare(start, 4, "null") == 0) {
    out->reset();
    *pos = start + 4;
    return true;
  }
  std::string value;
  if (!ReadQuoted(line, start, pos, &value)) return false;
  *out = std::move(value);
  return true;
}

bool ParseJsonInt64Value(const std::string& line, const std::string& key,
                         size_t* pos, int64_t* out) {
  size_t start;
  if (!FindValue(line, key, *pos, &start)) return false;
  size_t end = start;
  if (end < line.size() && line[end] == '-') ++end;
  const size_t digits_begin = end;
  while (end < line.size() && std::isdigit(static_cast<unsigned char>(line[end]))) ++end;
  if (end == digits_begin) return false;
  try {
    *out = static_cast<int64_t>(std::stoll(line.substr(start, end - start)));
    *pos = end;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

}  // namespace

const char* RequestStatusName(RequestStatus status) {
  switch (status) {
    case RequestStatus::kPending:  return "PENDING";
    case RequestStatus::kApproved: return "APPROVED";
    case RequestStatus::kRejected: return "REJECTED";
  }
  return "PENDING";
}

bool ParseRequestStatus(const std::string& name, RequestStatus* out) {
  if (name == "PENDING")  { *out = RequestStatus::kPending;  return true; }
  if (name == "APPROVED") { *out = RequestStatus::kApproved; return true; }
  if (name == "REJECTED") { *out = RequestStatus::kRejected; return true; }
  return false;
}

Principal ConsolePrincipal() {
  return Principal{kConsolePrincipalId, kConsolePrincipalName};
}

std::string GenerateUuidV4() {
  static thread_local std::random_device rd;
  static thread_local std::mt19937 gen(rd());
  static thread_local std::uniform_int_distribution<int> dis(0, 15);
  const char* hexdig = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (int i = 0; i < 32; ++i) {
    if (i == 8 || i == 12 || i == 16 || i == 20) out += '-';
    if (i == 12) out += '4';
    else if (i == 16) out += hexdig[8 + dis(gen) % 4];
    else out += hexdig[dis(gen)];
  }
  return out;
}

StagedRequest StagedRequest::Create(Principal requester, std::string command_text,
                                    int64_t now_utc_ms) {
  StagedRequest r;
  r.id = GenerateUuidV4();
  r.requester = std::move(requester);
  r.command_text = std::move(command_text);
  r.timestamp_ms = now_utc_ms;
  r.status = RequestStatus::kPending;
  return r;
}

std::string StagedRequest::ToJsonLine() const {
  std::ostringstream o;
  o << "{\"schema_version\":" << kSchemaVersion
    << ",\"id\":\"" << JsonEscape(id) << "\""
    << ",\"requester_id\":\"" << JsonEscape(requester.id) << "\""
    << ",\"requester_name\":\"" << JsonEscape(requester.name) << "\""
    << ",\"command_text\":\"" << JsonEscape(command_text) << "\""
    << ",\"timestamp_ms\":" << timestamp_ms;
  WriteNullableString(o, "justification", justification);
  WriteNullableString(o, "reviewer_id",
                      reviewer ? std::optional<std::string>(reviewer->id) : std::nullopt);
  WriteNullableString(o, "reviewer_name",
                      reviewer ? std::optional<std::string>(reviewer->name) : std::nullopt);
  o << ",\"status\":\"" << RequestStatusName(status) << "\"}";
  return o.str();
}

bool StagedRequest::FromJsonLine(const std::string& line, StagedRequest& out) {
  if (line.empty() || line.front() != '{' || line.back() != '}')
    return false;
  size_t pos = 0;
  int64_t schema = 0;
  if (!ParseJsonInt64Value(line, "schema_version", &pos, &schema)) return false;
  if (schema != kSchemaVersion) return false;
  if (!ParseJsonStringValue(line, "id", &pos, &out.id)) return false;
  if (!ParseJsonStringValue(line, "requester_id", &pos, &out.requester.id)) return false;
  if (!ParseJsonStringValue(line, "requester_name", &pos, &out.requester.name)) return false;
  if (!ParseJsonStringValue(line, "command_text", &pos, &out.command_text)) return false;
  if (!ParseJsonInt64Value(line, "timestamp_ms", &pos, &out.timestamp_ms)) return false;
  if (!ParseJsonNullableStringValue(line, "justification", &pos, &out.justification)) return false;
  std::optional<std::string> reviewer_id;
  std::optional<std::string> reviewer_name;
  if (!ParseJsonNullableStringValue(line, "reviewer_id", &pos, &reviewer_id)) return false;
  if (!ParseJsonNullableStringValue(line, "reviewer_name", &pos, &reviewer_name)) return false;
  if (reviewer_id.has_value())
    out.reviewer = Principal{*reviewer_id, reviewer_name.value_or("")};
  else
    out.reviewer.reset();
  std::string status;
  if (!ParseJsonStringValue(line, "status", &pos, &status)) return false;
  if (!ParseRequestStatus(status, &out.status)) return false;
  return true;
}

}  // namespace stagegate::staging
