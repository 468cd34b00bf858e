/**
 * @file        tests/unit/codegen/code_writer_test.cpp
 * @brief       Unit tests for CodeWriter and Emitter
 *
 * @copyright   Copyright (c) 2026 Tom Clay <tomc@tctechstuff.com>
 *              All rights reserved.
 *
 * @license     BSD 3-Clause License
 *              See LICENSE file in the project root for full license text.
 */

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>

#include <gdx/codegen/code_writer.h>
#include <gdx/codegen/emitter.h>

#include "test_api.h"

using namespace gdx::codegen;

// =============================================================================
// CodeWriter
// =============================================================================

TEST_CASE("CodeWriter indents nested blocks", "[code_writer]") {
  CodeWriter w;
  w.open("impl Foo");
  w.open("fn bar(&self) -> i32");
  w.println("{} + {}", 1, 2);
  w.close();
  w.close(";");

  CHECK(w.str() ==
        "impl Foo {\n"
        "    fn bar(&self) -> i32 {\n"
        "        1 + 2\n"
        "    }\n"
        "};\n");
  CHECK(w.depth() == 0);
}

TEST_CASE("CodeWriter leaves blank lines unindented", "[code_writer]") {
  CodeWriter w;
  w.indent();
  w.println("a");
  w.println();
  w.println("b");
  w.dedent();

  CHECK(w.str() == "    a\n\n    b\n");
}

TEST_CASE("CodeWriter re-indents appended text", "[code_writer]") {
  CodeWriter inner;
  inner.open("struct S");
  inner.println("x: i32,");
  inner.close();

  CodeWriter w;
  w.open("mod m");
  w.append(inner.take());
  w.close();

  CHECK(inner.empty());
  CHECK(w.str() ==
        "mod m {\n"
        "    struct S {\n"
        "        x: i32,\n"
        "    }\n"
        "}\n");
}

TEST_CASE("CodeWriter print continues the current line", "[code_writer]") {
  CodeWriter w;
  w.indent();
  w.print("let x = ");
  w.print("{};", 5);
  w.println();
  w.dedent();

  CHECK(w.str() == "    let x = 5;\n");

  auto text = w.take();
  CHECK(text == "    let x = 5;\n");
  CHECK(w.empty());
  CHECK(w.depth() == 0);
}

// =============================================================================
// Emitter
// =============================================================================

TEST_CASE("Emitter writes queued files below the output directory", "[emitter]") {
  test::TempDir dir;
  Emitter emitter(dir.path() / "gen");
  emitter.submit("sys/central.rs", "pub struct A;\n");
  emitter.submit("core/classes/node.rs", "pub const X: i64 = 1;\n");
  CHECK(emitter.pending() == 2);

  auto stats = emitter.flush();
  REQUIRE(stats);
  CHECK(stats->written == 2);
  CHECK(stats->unchanged == 0);
  CHECK(emitter.pending() == 0);

  CHECK(test::ReadFile(dir.path() / "gen" / "sys" / "central.rs") == "pub struct A;\n");
  CHECK(test::ReadFile(dir.path() / "gen" / "core" / "classes" / "node.rs") == "pub const X: i64 = 1;\n");
}

TEST_CASE("Emitter skips files whose content is unchanged", "[emitter]") {
  test::TempDir dir;
  Emitter emitter(dir.path());

  emitter.submit("a.rs", "same\n");
  emitter.submit("b.rs", "old\n");
  REQUIRE(emitter.flush());

  emitter.submit("a.rs", "same\n");
  emitter.submit("b.rs", "new\n");
  auto stats = emitter.flush();
  REQUIRE(stats);
  CHECK(stats->unchanged == 1);
  CHECK(stats->written == 1);
  CHECK(test::ReadFile(dir.path() / "b.rs") == "new\n");
}

TEST_CASE("FileContentMatches compares size and hash", "[emitter]") {
  test::TempDir dir;
  auto path = dir.path() / "file.rs";

  CHECK_FALSE(FileContentMatches(path, "abc"));
  test::WriteFile(path, "abc");
  CHECK(FileContentMatches(path, "abc"));
  CHECK_FALSE(FileContentMatches(path, "abd"));
  CHECK_FALSE(FileContentMatches(path, "abcd"));
}

TEST_CASE("Emitter reports directories it cannot create", "[emitter]") {
  test::TempDir dir;
  auto blocker = dir.path() / "blocker";
  test::WriteFile(blocker, "not a directory");

  Emitter emitter(blocker);
  emitter.submit("sys/central.rs", "x");
  auto stats = emitter.flush();
  REQUIRE_FALSE(stats);
  CHECK(stats.error().category == gdx::ErrorCategory::IO);
  CHECK(emitter.pending() == 0);
}
