/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE CharacterLoaderTests
#include <boost/test/unit_test.hpp>

#include "../common/CharacterTestRecords.hpp"
#include "core/Logger.hpp"
#include "managers/CharacterLoader.hpp"
#include <algorithm>
#include <string>
#include <vector>

using namespace TrekEngine;
using TrekTest::makeCharacterRecord;
using TrekTest::makeRecord;

namespace {

bool logContains(const LoadResult& result, const std::string& text) {
  return std::any_of(result.log.begin(), result.log.end(),
                     [&text](const std::string& line) {
                       return line.find(text) != std::string::npos;
                     });
}

std::vector<std::string> sortedMessages(const std::vector<LoadIssue>& issues) {
  std::vector<std::string> messages;
  for (const auto& issue : issues) {
    messages.push_back(issue.message);
  }
  std::sort(messages.begin(), messages.end());
  return messages;
}

} // namespace

struct CharacterLoaderFixture {
  CharacterLoader loader;
};

BOOST_FIXTURE_TEST_SUITE(CharacterLoaderScenarioTests, CharacterLoaderFixture)

BOOST_AUTO_TEST_CASE(TestSinglePlayerRecord) {
  std::vector<CharacterRecord> records{makeRecord(
      "p1.json",
      R"({"id": "P1", "name": "Jane", "age": 30, "gender": "F",
          "bio": "...", "is_player": true})")};

  LoadResult result = loader.load(records);

  BOOST_CHECK_EQUAL(result.registry.size(), 1);
  BOOST_REQUIRE(result.playerId.has_value());
  BOOST_CHECK_EQUAL(*result.playerId, "P1");
  BOOST_CHECK(result.errors.empty());
  BOOST_CHECK(result.warnings.empty());
  BOOST_REQUIRE(result.getPlayer() != nullptr);
  BOOST_CHECK_EQUAL(result.getPlayer()->getName(), "Jane");
  BOOST_CHECK(logContains(result, "All characters loaded and linked successfully."));
}

BOOST_AUTO_TEST_CASE(TestMutualSpouses) {
  std::vector<CharacterRecord> records{
      makeRecord("a.json", R"({"id": "A", "name": "Ann", "age": 30, "gender": "F",
                               "bio": "", "is_player": true,
                               "relationship_ids": {"spouse_id": "B"}})"),
      makeRecord("b.json", R"({"id": "B", "name": "Ben", "age": 31, "gender": "M",
                               "bio": "",
                               "relationship_ids": {"spouse_id": "A"}})")};

  LoadResult result = loader.load(records);

  const Character* a = result.registry.find("A");
  const Character* b = result.registry.find("B");
  BOOST_REQUIRE(a != nullptr);
  BOOST_REQUIRE(b != nullptr);
  BOOST_CHECK(a->getSpouse() == b);
  BOOST_CHECK(b->getSpouse() == a);
  BOOST_CHECK(result.errors.empty());
  BOOST_CHECK(result.warnings.empty());
}

BOOST_AUTO_TEST_CASE(TestEmptyInput) {
  LoadResult result = loader.load({});

  BOOST_CHECK(result.registry.empty());
  BOOST_CHECK(!result.playerId.has_value());
  BOOST_CHECK(result.errors.empty());
  BOOST_CHECK(result.getPlayer() == nullptr);
  BOOST_CHECK(logContains(result, "No characters to link (character registry is empty)."));
}

BOOST_AUTO_TEST_CASE(TestFamilyLinks) {
  std::vector<CharacterRecord> records{
      makeCharacterRecord("DAD", "Dad", true,
                          R"("spouse_id": "MOM", "children_ids": ["KID1", "KID2"])"),
      makeCharacterRecord("MOM", "Mom", false,
                          R"("spouse_id": "DAD", "children_ids": ["KID1", "KID2"])"),
      makeCharacterRecord("KID1", "First", false,
                          R"("parent_ids": ["DAD", "MOM"], "sibling_ids": ["KID2"])"),
      makeCharacterRecord("KID2", "Second", false,
                          R"("parent_ids": ["DAD", "MOM"], "sibling_ids": ["KID1"])")};

  LoadResult result = loader.load(records);
  BOOST_CHECK(result.errors.empty());
  BOOST_CHECK(result.warnings.empty());

  const Character* dad = result.registry.find("DAD");
  const Character* mom = result.registry.find("MOM");
  const Character* kid1 = result.registry.find("KID1");
  const Character* kid2 = result.registry.find("KID2");
  BOOST_REQUIRE(dad && mom && kid1 && kid2);

  BOOST_REQUIRE_EQUAL(dad->getChildren().size(), 2);
  BOOST_CHECK(dad->getChildren()[0] == kid1);
  BOOST_CHECK(dad->getChildren()[1] == kid2);
  BOOST_REQUIRE_EQUAL(kid1->getParents().size(), 2);
  BOOST_CHECK(kid1->getParents()[0] == dad);
  BOOST_CHECK(kid1->getParents()[1] == mom);
  BOOST_REQUIRE_EQUAL(kid2->getSiblings().size(), 1);
  BOOST_CHECK(kid2->getSiblings()[0] == kid1);

  BOOST_CHECK_EQUAL(dad->getFamilyInfoDisplay(),
                    "Family Information:\n"
                    "  Spouse: Mom (ID: MOM)\n"
                    "  Parents: Unknown\n"
                    "  Children: First, Second");
  BOOST_CHECK_EQUAL(kid1->getFamilyInfoDisplay(),
                    "Family Information:\n"
                    "  Spouse: None\n"
                    "  Parents: Dad, Mom\n"
                    "  Children: None\n"
                    "  Siblings: Second");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(CharacterLoaderPropertyTests, CharacterLoaderFixture)

BOOST_AUTO_TEST_CASE(TestRepeatedLoadsAreIndependent) {
  std::vector<CharacterRecord> records{
      makeCharacterRecord("A", "Ann", true, R"("spouse_id": "GHOST")"),
      makeCharacterRecord("B", "Ben"),
      makeCharacterRecord("A", "Second Ann"),
      makeRecord("broken.json", R"({"id": "Z"})")};

  LoadResult first = loader.load(records);
  LoadResult second = loader.load(records);

  BOOST_CHECK(first.registry.ids() == second.registry.ids());
  BOOST_CHECK(first.playerId == second.playerId);
  BOOST_CHECK(sortedMessages(first.errors) == sortedMessages(second.errors));
  BOOST_CHECK(sortedMessages(first.warnings) == sortedMessages(second.warnings));
  BOOST_CHECK(first.log == second.log);

  // Nothing carries over into an unrelated batch
  LoadResult third = loader.load({makeCharacterRecord("C", "Cid")});
  BOOST_CHECK_EQUAL(third.registry.size(), 1);
  BOOST_CHECK(!third.registry.contains("A"));
  BOOST_CHECK(!third.playerId.has_value());
  BOOST_CHECK_EQUAL(third.countIssues(LoadIssueKind::DuplicateIdError), 0);
  BOOST_CHECK(third.warnings.empty());
}

BOOST_AUTO_TEST_CASE(TestDuplicateKeepsFirst) {
  std::vector<CharacterRecord> records{
      makeRecord("first.json", R"({"id": "X", "name": "Original", "age": 20,
                                   "gender": "F", "bio": "", "is_player": true})"),
      makeRecord("second.json", R"({"id": "X", "name": "Impostor", "age": 99,
                                    "gender": "M", "bio": ""})")};

  LoadResult result = loader.load(records);

  BOOST_REQUIRE_EQUAL(result.registry.size(), 1);
  const Character* x = result.registry.find("X");
  BOOST_REQUIRE(x != nullptr);
  BOOST_CHECK_EQUAL(x->getName(), "Original");
  BOOST_CHECK_EQUAL(x->getAge(), 20);

  BOOST_REQUIRE_EQUAL(result.countIssues(LoadIssueKind::DuplicateIdError), 1);
  BOOST_REQUIRE_EQUAL(result.errors.size(), 1);
  BOOST_CHECK_EQUAL(result.errors[0].source, "second.json");
  BOOST_CHECK(result.errors[0].message.find("second.json") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestLastPlayerWins) {
  std::vector<CharacterRecord> records{makeCharacterRecord("A", "Ann", true),
                                       makeCharacterRecord("B", "Ben"),
                                       makeCharacterRecord("C", "Cid", true)};

  LoadResult result = loader.load(records);

  BOOST_REQUIRE(result.playerId.has_value());
  BOOST_CHECK_EQUAL(*result.playerId, "C");
  BOOST_REQUIRE_EQUAL(result.errors.size(), 1);
  BOOST_CHECK_EQUAL(result.errors[0].kind, LoadIssueKind::MultiplePlayersError);

  const std::string& message = result.errors[0].message;
  const size_t oldPos = message.find("Old: A");
  const size_t newPos = message.find("New: C");
  BOOST_REQUIRE(oldPos != std::string::npos);
  BOOST_REQUIRE(newPos != std::string::npos);
  BOOST_CHECK(oldPos < newPos);
}

BOOST_AUTO_TEST_CASE(TestDanglingSpouseIsSafe) {
  std::vector<CharacterRecord> records{
      makeCharacterRecord("A", "Ann", true,
                          R"("spouse_id": "GHOST", "sibling_ids": ["B"])"),
      makeCharacterRecord("B", "Ben")};

  LoadResult result = loader.load(records);

  const Character* a = result.registry.find("A");
  BOOST_REQUIRE(a != nullptr);
  BOOST_CHECK(a->getSpouse() == nullptr);
  BOOST_REQUIRE(a->getSpouseId().has_value());
  BOOST_CHECK_EQUAL(*a->getSpouseId(), "GHOST");
  BOOST_REQUIRE_EQUAL(a->getSiblings().size(), 1);
  BOOST_CHECK(a->getSiblings()[0] == result.registry.find("B"));

  BOOST_CHECK(result.errors.empty());
  BOOST_REQUIRE_EQUAL(result.warnings.size(), 1);
  BOOST_CHECK_EQUAL(result.warnings[0].kind, LoadIssueKind::DanglingReferenceWarning);
  BOOST_CHECK_EQUAL(result.warnings[0].source, "A.json");
  BOOST_CHECK(logContains(result, "spouse ID 'GHOST' not found"));
}

BOOST_AUTO_TEST_CASE(TestDanglingListEntriesAreSkipped) {
  std::vector<CharacterRecord> records{
      makeCharacterRecord("A", "Ann", true,
                          R"("parent_ids": ["NOPE"], "children_ids": ["B", "MISSING"])"),
      makeCharacterRecord("B", "Ben")};

  LoadResult result = loader.load(records);

  const Character* a = result.registry.find("A");
  BOOST_REQUIRE(a != nullptr);
  BOOST_CHECK(a->getParents().empty());
  BOOST_REQUIRE_EQUAL(a->getChildren().size(), 1);
  BOOST_CHECK_EQUAL(a->getChildren()[0]->getId(), "B");
  BOOST_CHECK_EQUAL(result.countIssues(LoadIssueKind::DanglingReferenceWarning), 2);
  BOOST_CHECK(logContains(result, "parent ID 'NOPE' not found."));
  BOOST_CHECK(logContains(result, "child ID 'MISSING' not found."));
}

BOOST_AUTO_TEST_CASE(TestNoPlayerDesignated) {
  LoadResult result =
      loader.load({makeCharacterRecord("A", "Ann"), makeCharacterRecord("B", "Ben")});

  BOOST_CHECK(!result.playerId.has_value());
  BOOST_CHECK_EQUAL(result.registry.size(), 2);
  BOOST_REQUIRE_EQUAL(result.errors.size(), 1);
  BOOST_CHECK_EQUAL(result.errors[0].kind, LoadIssueKind::NoPlayerDesignatedError);
  BOOST_CHECK(result.errors[0].source.empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(CharacterLoaderEdgeCaseTests, CharacterLoaderFixture)

BOOST_AUTO_TEST_CASE(TestInvalidRecordIsSkipped) {
  std::vector<CharacterRecord> records{
      makeCharacterRecord("A", "Ann", true, R"("spouse_id": "BAD")"),
      makeRecord("bad.json", R"({"id": "BAD", "name": "No Age", "gender": "F", "bio": ""})")};

  LoadResult result = loader.load(records);

  BOOST_CHECK_EQUAL(result.registry.size(), 1);
  BOOST_CHECK(!result.registry.contains("BAD"));
  BOOST_REQUIRE_EQUAL(result.errors.size(), 1);
  BOOST_CHECK_EQUAL(result.errors[0].kind, LoadIssueKind::ValidationError);
  BOOST_CHECK_EQUAL(result.errors[0].source, "bad.json");
  BOOST_CHECK_EQUAL(result.errors[0].message,
                    "Failed to load character 'bad.json': Missing required field 'age'");

  // The skipped record cannot be linked to
  BOOST_CHECK_EQUAL(result.warnings.size(), 1);
  BOOST_CHECK(result.registry.find("A")->getSpouse() == nullptr);
}

BOOST_AUTO_TEST_CASE(TestParseErrorRecord) {
  CharacterRecord broken;
  broken.source = "broken.json";
  broken.parseError = "Line 1, Column 2: Unexpected end of input";

  LoadResult result = loader.load({makeCharacterRecord("A", "Ann", true), broken});

  BOOST_CHECK_EQUAL(result.registry.size(), 1);
  BOOST_REQUIRE_EQUAL(result.errors.size(), 1);
  BOOST_CHECK_EQUAL(result.errors[0].kind, LoadIssueKind::ValidationError);
  BOOST_CHECK_EQUAL(result.errors[0].source, "broken.json");
  BOOST_CHECK(result.errors[0].message.find("Unexpected end of input") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestUnnamedRecordsGetIndexSource) {
  CharacterRecord unnamed("", TrekTest::parseJson("42"));

  LoadResult result = loader.load({makeCharacterRecord("A", "Ann", true), unnamed});

  BOOST_REQUIRE_EQUAL(result.errors.size(), 1);
  BOOST_CHECK_EQUAL(result.errors[0].source, "record[1]");
}

BOOST_AUTO_TEST_CASE(TestSelfReferenceResolves) {
  LoadResult result = loader.load(
      {makeCharacterRecord("A", "Ann", true, R"("spouse_id": "A", "sibling_ids": ["A"])")});

  const Character* a = result.registry.find("A");
  BOOST_REQUIRE(a != nullptr);
  BOOST_CHECK(a->getSpouse() == a);
  BOOST_REQUIRE_EQUAL(a->getSiblings().size(), 1);
  BOOST_CHECK(a->getSiblings()[0] == a);
  BOOST_CHECK(result.warnings.empty());
}

BOOST_AUTO_TEST_CASE(TestDuplicateIdsInListAreKept) {
  LoadResult result = loader.load(
      {makeCharacterRecord("A", "Ann", true, R"("children_ids": ["B", "B"])"),
       makeCharacterRecord("B", "Ben")});

  const Character* a = result.registry.find("A");
  BOOST_REQUIRE(a != nullptr);
  BOOST_CHECK_EQUAL(a->getChildren().size(), 2);
}

BOOST_AUTO_TEST_CASE(TestAsymmetricLinksAreNotCompleted) {
  LoadResult result = loader.load(
      {makeCharacterRecord("A", "Ann", true, R"("spouse_id": "B")"),
       makeCharacterRecord("B", "Ben")});

  BOOST_CHECK(result.registry.find("A")->getSpouse() == result.registry.find("B"));
  BOOST_CHECK(result.registry.find("B")->getSpouse() == nullptr);
}

BOOST_AUTO_TEST_CASE(TestForwardReferencesResolve) {
  // The target appears later in the batch than the reference
  LoadResult result = loader.load(
      {makeCharacterRecord("A", "Ann", true, R"("parent_ids": ["Z"])"),
       makeCharacterRecord("Z", "Zed")});

  BOOST_REQUIRE_EQUAL(result.registry.find("A")->getParents().size(), 1);
  BOOST_CHECK_EQUAL(result.registry.find("A")->getParents()[0]->getName(), "Zed");
}

BOOST_AUTO_TEST_CASE(TestLinksSurviveMove) {
  LoadResult result = loader.load(
      {makeCharacterRecord("A", "Ann", true, R"("spouse_id": "B")"),
       makeCharacterRecord("B", "Ben", false, R"("spouse_id": "A")")});

  LoadResult moved = std::move(result);
  const Character* a = moved.registry.find("A");
  const Character* b = moved.registry.find("B");
  BOOST_REQUIRE(a && b);
  BOOST_CHECK(a->getSpouse() == b);
  BOOST_CHECK(b->getSpouse() == a);
  BOOST_CHECK(moved.getPlayer() == a);
}

BOOST_AUTO_TEST_CASE(TestEmptySpouseIdIsNotDangling) {
  LoadResult result = loader.load(
      {makeCharacterRecord("A", "Ann", true, R"("spouse_id": "")")});

  BOOST_CHECK(result.errors.empty());
  BOOST_CHECK(result.warnings.empty());
  BOOST_CHECK(result.registry.find("A")->getSpouse() == nullptr);
  BOOST_CHECK(!logContains(result, "spouse ID"));
}

BOOST_AUTO_TEST_CASE(TestLargeBatchWithDanglingLinks) {
  const int batchSize = 1000;
  std::vector<CharacterRecord> records;
  records.reserve(batchSize);
  for (int i = 0; i < batchSize; ++i) {
    const std::string id = "C" + std::to_string(i);
    // Even records point at the next id, odd records at a missing one
    const std::string spouse = (i % 2 == 0)
                                   ? "C" + std::to_string(i + 1)
                                   : "GONE" + std::to_string(i);
    records.push_back(makeCharacterRecord(id, "Name " + id, i == 0,
                                          R"("spouse_id": ")" + spouse + "\""));
  }

  // One warning per odd record, keep the console quiet while loading
  TREK_ENABLE_BENCHMARK_MODE();
  BOOST_CHECK(Logger::IsBenchmarkMode());
  LoadResult result = loader.load(records);
  TREK_DISABLE_BENCHMARK_MODE();
  BOOST_CHECK(!Logger::IsBenchmarkMode());

  BOOST_CHECK_EQUAL(result.registry.size(), static_cast<size_t>(batchSize));
  BOOST_CHECK(result.errors.empty());
  BOOST_CHECK_EQUAL(result.warnings.size(), static_cast<size_t>(batchSize / 2));
  BOOST_REQUIRE(result.playerId.has_value());
  BOOST_CHECK_EQUAL(*result.playerId, "C0");

  const Character* first = result.registry.find("C0");
  BOOST_REQUIRE(first != nullptr);
  BOOST_REQUIRE(first->getSpouse() != nullptr);
  BOOST_CHECK_EQUAL(first->getSpouse()->getId(), "C1");
  BOOST_CHECK(result.registry.find("C1")->getSpouse() == nullptr);
}

BOOST_AUTO_TEST_CASE(TestErrorsAreMirroredInLog) {
  LoadResult result = loader.load({makeCharacterRecord("A", "Ann")});

  BOOST_REQUIRE_EQUAL(result.errors.size(), 1);
  BOOST_CHECK(logContains(result, "ERROR: " + result.errors[0].message));
  BOOST_CHECK(logContains(result, "completed with 1 issues."));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(CharacterLoaderSourceTests, CharacterLoaderFixture)

namespace {

class UnavailableSource : public CharacterRecordSource {
public:
  std::string describe() const override { return "nowhere"; }
  bool isAvailable() const override { return false; }
  std::vector<CharacterRecord> readRecords() override {
    ++readCount;
    return {};
  }
  int readCount{0};
};

} // namespace

BOOST_AUTO_TEST_CASE(TestUnavailableSourceYieldsNoResult) {
  UnavailableSource source;
  BOOST_CHECK(!loader.loadFromSource(source).has_value());
  BOOST_CHECK_EQUAL(source.readCount, 0);
}

BOOST_AUTO_TEST_CASE(TestMemorySource) {
  CharacterMemorySource source({makeCharacterRecord("A", "Ann", true),
                                makeCharacterRecord("B", "Ben")},
                               "fixture");

  std::optional<LoadResult> result = loader.loadFromSource(source);
  BOOST_REQUIRE(result.has_value());
  BOOST_CHECK_EQUAL(result->registry.size(), 2);
  BOOST_CHECK(logContains(*result, "Starting character load from 'fixture'"));
}

BOOST_AUTO_TEST_CASE(TestEmptySourceWarnsInLog) {
  CharacterMemorySource source({}, "empty");

  std::optional<LoadResult> result = loader.loadFromSource(source);
  BOOST_REQUIRE(result.has_value());
  BOOST_CHECK(result->registry.empty());
  BOOST_CHECK(result->errors.empty());
  BOOST_CHECK(logContains(*result, "No character records found in 'empty'."));
}

BOOST_AUTO_TEST_SUITE_END()
