#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "patch/PatchParser.h"

namespace {

PatchError::Kind parseErrorKind(const std::string& text, size_t* line = nullptr, std::string* message = nullptr) {
  try {
    parsePatch(text);
  } catch (const PatchError& e) {
    if (line) *line = e.line();
    if (message) *message = e.what();
    return e.kind();
  }
  ADD_FAILURE() << "expected parsePatch to throw for:\n" << text;
  return PatchError::Kind::Io;
}

}  // namespace

TEST(PatchParser, ParsesAllThreeHunkKindsInOrder) {
  const std::string text =
      "*** Begin Patch\n"
      "*** Add File: hello.txt\n"
      "+Hello\n"
      "+World\n"
      "*** Delete File: old.txt\n"
      "*** Update File: src/app.py\n"
      "@@ def greet():\n"
      "-    print(\"Hi\")\n"
      "+    print(\"Hello, world!\")\n"
      "*** End Patch";

  Patch patch = parsePatch(text);
  ASSERT_EQ(patch.hunks.size(), 3u);

  EXPECT_EQ(patch.hunks[0].kind, HunkKind::Add);
  EXPECT_EQ(patch.hunks[0].path, "hello.txt");
  EXPECT_EQ(patch.hunks[0].contents, "Hello\nWorld\n");

  EXPECT_EQ(patch.hunks[1].kind, HunkKind::Delete);
  EXPECT_EQ(patch.hunks[1].path, "old.txt");

  const Hunk& update = patch.hunks[2];
  EXPECT_EQ(update.kind, HunkKind::Update);
  EXPECT_EQ(update.path, "src/app.py");
  EXPECT_TRUE(update.movePath.empty());
  ASSERT_EQ(update.chunks.size(), 1u);
  ASSERT_TRUE(update.chunks[0].changeContext.has_value());
  EXPECT_EQ(*update.chunks[0].changeContext, "def greet():");
  EXPECT_EQ(update.chunks[0].oldLines, std::vector<std::string>({"    print(\"Hi\")"}));
  EXPECT_EQ(update.chunks[0].newLines, std::vector<std::string>({"    print(\"Hello, world!\")"}));
  EXPECT_FALSE(update.chunks[0].isEndOfFile);
}

TEST(PatchParser, AddFileWithoutLinesHasEmptyContents) {
  Patch patch = parsePatch("*** Begin Patch\n*** Add File: empty.txt\n*** End Patch\n");
  ASSERT_EQ(patch.hunks.size(), 1u);
  EXPECT_EQ(patch.hunks[0].kind, HunkKind::Add);
  EXPECT_EQ(patch.hunks[0].contents, "");
}

TEST(PatchParser, PatchWithNoHunksIsValid) {
  Patch patch = parsePatch("*** Begin Patch\n*** End Patch");
  EXPECT_TRUE(patch.hunks.empty());
}

TEST(PatchParser, UpdateWithMoveAndMultipleChunks) {
  const std::string text =
      "*** Begin Patch\n"
      "*** Update File: a.txt\n"
      "*** Move to: b/a.txt\n"
      "@@\n"
      " one\n"
      "-two\n"
      "+TWO\n"
      "@@ section\n"
      "-last\n"
      "+LAST\n"
      "*** End of File\n"
      "*** End Patch";

  Patch patch = parsePatch(text);
  ASSERT_EQ(patch.hunks.size(), 1u);
  const Hunk& hunk = patch.hunks[0];
  EXPECT_EQ(hunk.movePath, "b/a.txt");
  ASSERT_EQ(hunk.chunks.size(), 2u);

  EXPECT_FALSE(hunk.chunks[0].changeContext.has_value());
  EXPECT_EQ(hunk.chunks[0].oldLines, std::vector<std::string>({"one", "two"}));
  EXPECT_EQ(hunk.chunks[0].newLines, std::vector<std::string>({"one", "TWO"}));
  EXPECT_FALSE(hunk.chunks[0].isEndOfFile);

  ASSERT_TRUE(hunk.chunks[1].changeContext.has_value());
  EXPECT_EQ(*hunk.chunks[1].changeContext, "section");
  EXPECT_EQ(hunk.chunks[1].oldLines, std::vector<std::string>({"last"}));
  EXPECT_EQ(hunk.chunks[1].newLines, std::vector<std::string>({"LAST"}));
  EXPECT_TRUE(hunk.chunks[1].isEndOfFile);
}

TEST(PatchParser, FirstChunkMayOmitContextMarker) {
  Patch patch = parsePatch(
      "*** Begin Patch\n"
      "*** Update File: f\n"
      " keep\n"
      "-old\n"
      "+new\n"
      "*** End Patch");
  ASSERT_EQ(patch.hunks.size(), 1u);
  ASSERT_EQ(patch.hunks[0].chunks.size(), 1u);
  EXPECT_FALSE(patch.hunks[0].chunks[0].changeContext.has_value());
  EXPECT_EQ(patch.hunks[0].chunks[0].oldLines, std::vector<std::string>({"keep", "old"}));
}

TEST(PatchParser, BlankLineInsideChunkIsContext) {
  Patch patch = parsePatch(
      "*** Begin Patch\n"
      "*** Update File: f\n"
      "@@\n"
      " foo\n"
      "\n"
      "-bar\n"
      "+baz\n"
      "*** End Patch");
  const UpdateChunk& chunk = patch.hunks[0].chunks[0];
  EXPECT_EQ(chunk.oldLines, std::vector<std::string>({"foo", "", "bar"}));
  EXPECT_EQ(chunk.newLines, std::vector<std::string>({"foo", "", "baz"}));
}

TEST(PatchParser, AcceptsCrlfLineEndings) {
  Patch patch = parsePatch("*** Begin Patch\r\n*** Add File: a.txt\r\n+x\r\n*** End Patch\r\n");
  ASSERT_EQ(patch.hunks.size(), 1u);
  EXPECT_EQ(patch.hunks[0].path, "a.txt");
  EXPECT_EQ(patch.hunks[0].contents, "x\n");
}

TEST(PatchParser, HeredocWrapperIsAccepted) {
  const std::string inner =
      "*** Begin Patch\n"
      "*** Delete File: gone.txt\n"
      "*** End Patch\n";
  for (const std::string& opener : {"<<EOF", "<<'EOF'", "<<\"EOF\""}) {
    Patch patch = parsePatch(opener + "\n" + inner + "EOF\n");
    ASSERT_EQ(patch.hunks.size(), 1u) << opener;
    EXPECT_EQ(patch.hunks[0].kind, HunkKind::Delete) << opener;
    EXPECT_EQ(patch.hunks[0].path, "gone.txt") << opener;
  }
}

TEST(PatchParser, HeredocWithoutClosingTerminatorIsRejected) {
  std::string message;
  auto kind = parseErrorKind(
      "<<EOF\n"
      "*** Begin Patch\n"
      "*** Add File: a.txt\n"
      "+x\n"
      "*** End Patch",
      nullptr, &message);
  EXPECT_EQ(kind, PatchError::Kind::MalformedPatch);
  EXPECT_NE(message.find("*** Begin Patch"), std::string::npos) << message;
}

TEST(PatchParser, HeredocWithBrokenInnerPatchReportsInnerBoundary) {
  std::string message;
  auto kind = parseErrorKind(
      "<<EOF\n"
      "*** Begin Patch\n"
      "*** Add File: a.txt\n"
      "+x\n"
      "EOF",
      nullptr, &message);
  EXPECT_EQ(kind, PatchError::Kind::MalformedPatch);
  EXPECT_NE(message.find("*** End Patch"), std::string::npos) << message;
}

TEST(PatchParser, MissingBoundariesAreRejected) {
  EXPECT_EQ(parseErrorKind("*** Add File: a.txt\n+x\n*** End Patch"), PatchError::Kind::MalformedPatch);
  EXPECT_EQ(parseErrorKind("*** Begin Patch\n*** Add File: a.txt\n+x"), PatchError::Kind::MalformedPatch);
  EXPECT_EQ(parseErrorKind("   \n\t"), PatchError::Kind::MalformedPatch);
}

TEST(PatchParser, InvalidHunkHeaderReportsLineNumber) {
  size_t line = 0;
  std::string message;
  auto kind = parseErrorKind(
      "*** Begin Patch\n"
      "*** Add File: a.txt\n"
      "+x\n"
      "*** Frobnicate File: b.txt\n"
      "*** End Patch",
      &line, &message);
  EXPECT_EQ(kind, PatchError::Kind::InvalidHunkHeader);
  EXPECT_EQ(line, 4u);
  EXPECT_NE(message.find("invalid hunk at line 4"), std::string::npos) << message;
  EXPECT_NE(message.find("'*** Frobnicate File: b.txt'"), std::string::npos) << message;
}

TEST(PatchParser, EmptyUpdateHunkIsRejected) {
  size_t line = 0;
  std::string message;
  auto kind = parseErrorKind("*** Begin Patch\n*** Update File: a.txt\n*** End Patch", &line, &message);
  EXPECT_EQ(kind, PatchError::Kind::EmptyUpdateHunk);
  EXPECT_EQ(line, 2u);
  EXPECT_NE(message.find("Update file hunk for path 'a.txt' is empty"), std::string::npos) << message;
}

TEST(PatchParser, SecondChunkRequiresContextMarker) {
  size_t line = 0;
  auto kind = parseErrorKind(
      "*** Begin Patch\n"
      "*** Update File: a.txt\n"
      "@@\n"
      "-a\n"
      "+b\n"
      "x\n"
      "*** End Patch",
      &line);
  EXPECT_EQ(kind, PatchError::Kind::MissingContextMarker);
  EXPECT_EQ(line, 6u);
}

TEST(PatchParser, UnexpectedLineInChunkIsRejected) {
  size_t line = 0;
  std::string message;
  auto kind = parseErrorKind(
      "*** Begin Patch\n"
      "*** Update File: a.txt\n"
      "@@\n"
      "foo\n"
      "*** End Patch",
      &line, &message);
  EXPECT_EQ(kind, PatchError::Kind::UnexpectedLine);
  EXPECT_EQ(line, 4u);
  EXPECT_NE(message.find("Unexpected line found in update hunk: 'foo'"), std::string::npos) << message;
}

TEST(PatchParser, EndOfFileMarkerWithoutLinesIsRejected) {
  size_t line = 0;
  auto kind = parseErrorKind(
      "*** Begin Patch\n"
      "*** Update File: a.txt\n"
      "@@\n"
      "*** End of File\n"
      "*** End Patch",
      &line);
  EXPECT_EQ(kind, PatchError::Kind::EmptyChunk);
  EXPECT_EQ(line, 4u);
}

TEST(PatchParser, ParsingIsDeterministic) {
  const std::string text =
      "*** Begin Patch\n"
      "*** Update File: a.txt\n"
      "@@ ctx\n"
      " a\n"
      "-b\n"
      "+c\n"
      "*** Add File: d.txt\n"
      "+d\n"
      "*** End Patch";
  Patch first = parsePatch(text);
  Patch second = parsePatch(text);
  ASSERT_EQ(first.hunks.size(), second.hunks.size());
  for (size_t i = 0; i < first.hunks.size(); ++i) {
    EXPECT_EQ(first.hunks[i].kind, second.hunks[i].kind);
    EXPECT_EQ(first.hunks[i].path, second.hunks[i].path);
    EXPECT_EQ(first.hunks[i].contents, second.hunks[i].contents);
    ASSERT_EQ(first.hunks[i].chunks.size(), second.hunks[i].chunks.size());
    for (size_t c = 0; c < first.hunks[i].chunks.size(); ++c) {
      EXPECT_TRUE(first.hunks[i].chunks[c].changeContext == second.hunks[i].chunks[c].changeContext);
      EXPECT_EQ(first.hunks[i].chunks[c].oldLines, second.hunks[i].chunks[c].oldLines);
      EXPECT_EQ(first.hunks[i].chunks[c].newLines, second.hunks[i].chunks[c].newLines);
    }
  }
}

TEST(PatchParser, ClassifiesChunkLines) {
  EXPECT_EQ(classifyChunkLine(" x"), ChunkLine::Context);
  EXPECT_EQ(classifyChunkLine("+x"), ChunkLine::Addition);
  EXPECT_EQ(classifyChunkLine("-x"), ChunkLine::Removal);
  EXPECT_EQ(classifyChunkLine(""), ChunkLine::Blank);
  EXPECT_EQ(classifyChunkLine("*** End of File"), ChunkLine::EndOfFile);
  EXPECT_EQ(classifyChunkLine("*** Add File: a"), ChunkLine::Other);
}

TEST(PatchParser, ParseUpdateChunkReportsConsumedLines) {
  const std::vector<std::string> lines = {"@@ fn", " a", "-b", "+c", "*** End of File", "@@"};
  size_t consumed = 0;
  UpdateChunk chunk = parseUpdateChunk(lines, 0, 10, false, consumed);
  EXPECT_EQ(consumed, 5u);
  EXPECT_EQ(*chunk.changeContext, "fn");
  EXPECT_TRUE(chunk.isEndOfFile);
}

TEST(PatchParser, ResolvesPathsAgainstRoot) {
  Patch patch = parsePatch(
      "*** Begin Patch\n"
      "*** Update File: src/../a.txt\n"
      "*** Move to: out/b.txt\n"
      "@@\n"
      "-x\n"
      "+y\n"
      "*** Delete File: /tmp/elsewhere/./c.txt\n"
      "*** End Patch");
  resolvePatchPaths(patch, fs::path("/work/proj"));
  EXPECT_EQ(patch.hunks[0].path, "/work/proj/a.txt");
  EXPECT_EQ(patch.hunks[0].movePath, "/work/proj/out/b.txt");
  EXPECT_EQ(patch.hunks[1].path, "/tmp/elsewhere/c.txt");
}

TEST(PatchParser, ResolvedPathDropsTrailingSeparator) {
  EXPECT_EQ(resolvePatchPath(fs::path("/work"), "dir/").u8string(), "/work/dir");
  EXPECT_EQ(resolvePatchPath(fs::path("/work"), "/").u8string(), "/");
}
