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

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "armada/common/status.h"
#include "armada/common/status_or.h"

namespace armada {

/// Columns of one table as declared by a CREATE TABLE statement.
struct TableSchema {
  std::string name;
  /// The parenthesised column definitions, verbatim from the source text.
  std::string definition;
  /// Lower-cased column names in declaration order. Table constraints such as
  /// PRIMARY KEY (...) are not columns.
  std::vector<std::string> columns;

  bool HasColumn(std::string_view column) const;
};

/// Extract the column definitions of `table_name` from SQL text. Matching is case
/// insensitive. For
///
///   CREATE TABLE circle (
///     id UUID PRIMARY KEY,
///     radius int NOT NULL
///   );
///
/// the definition is "(\n  id UUID PRIMARY KEY,\n  radius int NOT NULL\n)".
StatusOr<TableSchema> SchemaFromString(std::string_view sql, std::string_view table_name);

/// \class SchemaRegistry
///
/// Table schemas loaded once at startup. Not thread safe for writes; after
/// loading it is only read.
class SchemaRegistry {
 public:
  SchemaRegistry() = default;

  SchemaRegistry(const SchemaRegistry &) = delete;
  SchemaRegistry &operator=(const SchemaRegistry &) = delete;

  /// Register every CREATE TABLE statement found in `sql`.
  Status AddFromString(std::string_view sql);

  /// Register `table_name` from the given SQL file.
  Status AddTableFromFile(const std::string &path, std::string_view table_name);

  /// Register every table declared in the *.sql files of `dir`.
  Status LoadDirectory(const std::string &dir);

  /// NotFound if the table is not registered.
  StatusOr<const TableSchema *> Get(std::string_view table_name) const;

  std::vector<std::string> TableNames() const;

 private:
  Status Add(TableSchema schema);

  absl::flat_hash_map<std::string, TableSchema> tables_;
};

}  // namespace armada
