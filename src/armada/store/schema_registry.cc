// Copyright 2024 The Armada Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//  http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "armada/store/schema_registry.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "armada/util/logging.h"

namespace armada {

namespace {

constexpr std::string_view kCreateTable = "create table";

bool IsIdentifierChar(char c) {
  return absl::ascii_isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '"' ||
         c == '.';
}

size_t SkipSpace(std::string_view s, size_t pos) {
  while (pos < s.size() && absl::ascii_isspace(static_cast<unsigned char>(s[pos]))) {
    ++pos;
  }
  return pos;
}

bool ConsumeKeyword(std::string_view lower, size_t *pos, std::string_view keyword) {
  const size_t start = SkipSpace(lower, *pos);
  if (lower.substr(start, keyword.size()) != keyword) {
    return false;
  }
  const size_t end = start + keyword.size();
  if (end < lower.size() && IsIdentifierChar(lower[end])) {
    return false;
  }
  *pos = end;
  return true;
}

/// A CREATE TABLE header found in the text: the table name and where its
/// column list starts.
struct Statement {
  std::string name;
  size_t open_paren = std::string_view::npos;
};

/// Finds the next CREATE TABLE at or after `*pos`. Returns false at end of text.
bool NextStatement(std::string_view lower, size_t *pos, Statement *out) {
  while (true) {
    const size_t found = lower.find(kCreateTable, *pos);
    if (found == std::string_view::npos) {
      return false;
    }
    size_t cursor = found + kCreateTable.size();
    *pos = cursor;
    if (cursor < lower.size() && IsIdentifierChar(lower[cursor])) {
      continue;
    }
    size_t saved = cursor;
    if (!(ConsumeKeyword(lower, &cursor, "if") && ConsumeKeyword(lower, &cursor, "not") &&
          ConsumeKeyword(lower, &cursor, "exists"))) {
      cursor = saved;
    }
    cursor = SkipSpace(lower, cursor);
    const size_t name_start = cursor;
    while (cursor < lower.size() && IsIdentifierChar(lower[cursor])) {
      ++cursor;
    }
    if (cursor == name_start) {
      continue;
    }
    out->name = std::string(lower.substr(name_start, cursor - name_start));
    out->name.erase(std::remove(out->name.begin(), out->name.end(), '"'), out->name.end());
    out->open_paren = lower.find('(', cursor);
    *pos = cursor;
    return true;
  }
}

/// Splits the column list on top-level commas.
std::vector<std::string> ParseColumns(std::string_view definition) {
  std::vector<std::string> columns;
  std::string_view body = definition.substr(1, definition.size() - 2);
  int depth = 0;
  size_t start = 0;
  auto flush = [&columns, &body](size_t begin, size_t end) {
    std::string item =
        absl::AsciiStrToLower(absl::StripAsciiWhitespace(body.substr(begin, end - begin)));
    if (item.empty()) {
      return;
    }
    std::vector<std::string> tokens =
        absl::StrSplit(item, absl::ByAnyChar(" \t\r\n("), absl::SkipEmpty());
    if (tokens.empty()) {
      return;
    }
    const std::string &first = tokens.front();
    if (first == "primary" || first == "unique" || first == "constraint" ||
        first == "foreign" || first == "check" || first == "exclude") {
      return;
    }
    std::string name = first;
    name.erase(std::remove(name.begin(), name.end(), '"'), name.end());
    columns.push_back(std::move(name));
  };
  for (size_t i = 0; i < body.size(); ++i) {
    if (body[i] == '(') {
      ++depth;
    } else if (body[i] == ')') {
      --depth;
    } else if (body[i] == ',' && depth == 0) {
      flush(start, i);
      start = i + 1;
    }
  }
  flush(start, body.size());
  return columns;
}

StatusOr<TableSchema> SchemaAt(std::string_view sql,
                               const Statement &statement,
                               std::string_view table_name) {
  if (statement.open_paren == std::string_view::npos) {
    return Status::Invalid(absl::StrCat("could not read schema for table ", table_name,
                                        ": reached EOF when searching for ("));
  }
  int depth = 0;
  for (size_t i = statement.open_paren; i < sql.size(); ++i) {
    if (sql[i] == '(') {
      ++depth;
    } else if (sql[i] == ')' && --depth == 0) {
      const size_t after = SkipSpace(sql, i + 1);
      if (after >= sql.size() || sql[after] != ';') {
        break;
      }
      TableSchema schema;
      schema.name = statement.name;
      schema.definition =
          std::string(sql.substr(statement.open_paren, i + 1 - statement.open_paren));
      schema.columns = ParseColumns(schema.definition);
      if (schema.columns.empty()) {
        return Status::Invalid(absl::StrCat("table ", table_name, " declares no columns"));
      }
      return schema;
    }
  }
  return Status::Invalid(absl::StrCat("could not read schema for table ", table_name,
                                      ": reached EOF when searching for );"));
}

StatusOr<std::string> ReadFile(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    return Status::IOError(absl::StrCat("failed to open ", path));
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return Status::IOError(absl::StrCat("failed to read ", path));
  }
  return buffer.str();
}

}  // namespace

bool TableSchema::HasColumn(std::string_view column) const {
  return std::find(columns.begin(), columns.end(), absl::AsciiStrToLower(column)) !=
         columns.end();
}

StatusOr<TableSchema> SchemaFromString(std::string_view sql, std::string_view table_name) {
  const std::string lower = absl::AsciiStrToLower(sql);
  const std::string wanted = absl::AsciiStrToLower(table_name);
  size_t pos = 0;
  Statement statement;
  while (NextStatement(lower, &pos, &statement)) {
    if (statement.name == wanted) {
      return SchemaAt(sql, statement, table_name);
    }
  }
  return Status::NotFound(absl::StrCat("could not find table ", table_name));
}

Status SchemaRegistry::AddFromString(std::string_view sql) {
  const std::string lower = absl::AsciiStrToLower(sql);
  size_t pos = 0;
  Statement statement;
  bool found = false;
  while (NextStatement(lower, &pos, &statement)) {
    ARMADA_ASSIGN_OR_RETURN(TableSchema schema, SchemaAt(sql, statement, statement.name));
    ARMADA_RETURN_NOT_OK(Add(std::move(schema)));
    found = true;
  }
  if (!found) {
    return Status::Invalid("no CREATE TABLE statement found");
  }
  return Status::OK();
}

Status SchemaRegistry::AddTableFromFile(const std::string &path,
                                        std::string_view table_name) {
  ARMADA_ASSIGN_OR_RETURN(std::string sql, ReadFile(path));
  ARMADA_ASSIGN_OR_RETURN(TableSchema schema, SchemaFromString(sql, table_name));
  return Add(std::move(schema));
}

Status SchemaRegistry::LoadDirectory(const std::string &dir) {
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    return Status::IOError(absl::StrCat("failed to list ", dir, ": ", ec.message()));
  }
  std::vector<std::filesystem::path> files;
  for (const auto &entry : it) {
    if (entry.is_regular_file() && entry.path().extension() == ".sql") {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());
  for (const auto &file : files) {
    ARMADA_ASSIGN_OR_RETURN(std::string sql, ReadFile(file.string()));
    Status status = AddFromString(sql);
    if (!status.ok()) {
      return Status(status.code(), absl::StrCat(file.string(), ": ", status.message()));
    }
    ARMADA_LOG(INFO) << "Loaded table schemas from " << file.string();
  }
  return Status::OK();
}

StatusOr<const TableSchema *> SchemaRegistry::Get(std::string_view table_name) const {
  auto it = tables_.find(absl::AsciiStrToLower(table_name));
  if (it == tables_.end()) {
    return Status::NotFound(absl::StrCat("no schema registered for table ", table_name));
  }
  return &it->second;
}

std::vector<std::string> SchemaRegistry::TableNames() const {
  std::vector<std::string> names;
  names.reserve(tables_.size());
  for (const auto &[name, schema] : tables_) {
    names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

Status SchemaRegistry::Add(TableSchema schema) {
  const std::string name = schema.name;
  if (!tables_.emplace(name, std::move(schema)).second) {
    return Status::AlreadyExists(absl::StrCat("table ", name, " already registered"));
  }
  return Status::OK();
}

}  // namespace armada
