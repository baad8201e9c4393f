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

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "armada/store/run_record.h"
#include "gtest/gtest.h"

namespace armada {

namespace {

constexpr char kShapesSql[] = R"sql(
CREATE TABLE rectangle (
  id UUID PRIMARY KEY,
  width int NOT NULL,
  height int NOT NULL
);

create table circle (
  id UUID PRIMARY KEY,
  radius numeric(10, 2) NOT NULL,
  PRIMARY KEY (id)
);

CREATE TABLE circle_history (
  id UUID,
  radius int
);
)sql";

}  // namespace

TEST(SchemaFromStringTest, TestFindsNamedTable) {
  auto schema = SchemaFromString(kShapesSql, "circle");
  ASSERT_TRUE(schema.ok()) << schema.status();
  ASSERT_EQ(schema->name, "circle");
  ASSERT_EQ(schema->definition,
            "(\n  id UUID PRIMARY KEY,\n  radius numeric(10, 2) NOT NULL,\n"
            "  PRIMARY KEY (id)\n)");
  ASSERT_EQ(schema->columns, (std::vector<std::string>{"id", "radius"}));
}

TEST(SchemaFromStringTest, TestCaseInsensitive) {
  auto schema = SchemaFromString(kShapesSql, "RECTANGLE");
  ASSERT_TRUE(schema.ok());
  ASSERT_EQ(schema->columns, (std::vector<std::string>{"id", "width", "height"}));
  ASSERT_TRUE(schema->HasColumn("WIDTH"));
  ASSERT_FALSE(schema->HasColumn("radius"));
}

TEST(SchemaFromStringTest, TestPrefixIsNotAMatch) {
  auto schema = SchemaFromString("CREATE TABLE circle_history (id int);", "circle");
  ASSERT_TRUE(schema.status().IsNotFound());
}

TEST(SchemaFromStringTest, TestUnterminatedStatement) {
  ASSERT_TRUE(SchemaFromString("CREATE TABLE t", "t").status().IsInvalid());
  ASSERT_TRUE(SchemaFromString("CREATE TABLE t (id int", "t").status().IsInvalid());
  ASSERT_TRUE(SchemaFromString("CREATE TABLE t (id int)", "t").status().IsInvalid());
}

TEST(SchemaFromStringTest, TestIfNotExists) {
  auto schema = SchemaFromString("create table if not exists t (a int, b text);", "t");
  ASSERT_TRUE(schema.ok());
  ASSERT_EQ(schema->columns, (std::vector<std::string>{"a", "b"}));
}

TEST(SchemaRegistryTest, TestAddFromStringRegistersAllTables) {
  SchemaRegistry registry;
  ASSERT_TRUE(registry.AddFromString(kShapesSql).ok());
  ASSERT_EQ(registry.TableNames(),
            (std::vector<std::string>{"circle", "circle_history", "rectangle"}));
  ASSERT_TRUE(registry.Get("Circle").ok());
  ASSERT_TRUE(registry.Get("square").status().IsNotFound());
  ASSERT_TRUE(registry.AddFromString("create table circle (id int);").IsAlreadyExists());
  ASSERT_TRUE(registry.AddFromString("select 1;").IsInvalid());
}

TEST(SchemaRegistryTest, TestLoadDirectory) {
  auto dir = std::filesystem::temp_directory_path() /
             ("schema_registry_test_" + std::to_string(::getpid()));
  std::filesystem::create_directories(dir);
  {
    std::ofstream(dir / "runs.sql") << kRunsTableSql;
    std::ofstream(dir / "shapes.sql") << kShapesSql;
    std::ofstream(dir / "README") << "CREATE TABLE ignored (id int);";
  }
  SchemaRegistry registry;
  ASSERT_TRUE(registry.LoadDirectory(dir.string()).ok());
  ASSERT_TRUE(registry.Get("runs").ok());
  ASSERT_TRUE(registry.Get("rectangle").ok());
  ASSERT_TRUE(registry.Get("ignored").status().IsNotFound());

  SchemaRegistry single;
  ASSERT_TRUE(single.AddTableFromFile((dir / "shapes.sql").string(), "circle").ok());
  ASSERT_EQ(single.TableNames(), (std::vector<std::string>{"circle"}));
  ASSERT_TRUE(single.AddTableFromFile((dir / "missing.sql").string(), "t").IsIOError());
  std::filesystem::remove_all(dir);

  ASSERT_TRUE(registry.LoadDirectory((dir / "gone").string()).IsIOError());
}

}  // namespace armada
