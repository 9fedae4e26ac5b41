#include <gtest/gtest.h>
#include "diffreader.hpp"
#include "patch_builder.hpp"

class PatchBuilderTest : public ::testing::Test {
protected:
    // @@ -10,3 +10,4 @@ with a replaced line and an extra addition
    const std::string scenario_diff = R"(diff --git a/app.txt b/app.txt
index 1234567..89abcde 100644
--- a/app.txt
+++ b/app.txt
@@ -10,3 +10,4 @@
 unchanged1
-removed_line
+added_line_A
+added_line_B
 unchanged2
)";

    DiffHunk scenarioHunk() {
        FileDiff file = parseDiff(scenario_diff, "app.txt");
        return file.hunks.at(0);
    }

    static std::vector<std::string> bodyOf(const std::string& patch) {
        std::vector<std::string> body;
        size_t at = patch.find("\n@@ ");
        size_t pos = patch.find('\n', at + 1) + 1;
        while (pos < patch.size()) {
            size_t end = patch.find('\n', pos);
            body.push_back(patch.substr(pos, end - pos));
            pos = end + 1;
        }
        return body;
    }
};

TEST_F(PatchBuilderTest, SingleAdditionFromMixedHunk) {
    DiffHunk hunk = scenarioHunk();
    ASSERT_EQ(hunk.lines.size(), 5);

    std::string patch = createLinePatch("app.txt", hunk, {2});

    EXPECT_EQ(patch,
              "diff --git a/app.txt b/app.txt\n"
              "--- a/app.txt\n"
              "+++ b/app.txt\n"
              "@@ -10,3 +10,4 @@\n"
              " unchanged1\n"
              " removed_line\n"
              "+added_line_A\n"
              " unchanged2\n");
}

TEST_F(PatchBuilderTest, SingleDeletionKeepsNothingElse) {
    LinePatch patch = buildLinePatch(scenarioHunk(), {1});
    EXPECT_EQ(hunkHeader(patch), "@@ -10,3 +10,2 @@");
    std::vector<std::string> expected = {" unchanged1", "-removed_line", " unchanged2"};
    EXPECT_EQ(patch.body, expected);
}

TEST_F(PatchBuilderTest, FullSelectionMatchesRawPatch) {
    DiffHunk hunk = scenarioHunk();
    std::set<int> all;
    for (const DiffLine& line : hunk.lines) {
        if (line.mode() != EQ) all.insert(line.line_index);
    }

    LinePatch patch = buildLinePatch(hunk, all);
    EXPECT_EQ(patch.old_count, hunk.old_lines);
    EXPECT_EQ(patch.new_count, hunk.new_lines);
    EXPECT_EQ(bodyOf(renderLinePatch("app.txt", patch)), bodyOf(hunk.raw_patch));
}

TEST_F(PatchBuilderTest, CountsMatchBodyForEverySubset) {
    const std::string diff = R"(diff --git a/grid.txt b/grid.txt
--- a/grid.txt
+++ b/grid.txt
@@ -4,6 +4,6 @@
 c1
-d1
+a1
-d2
 c2
+a2
+a3
-d3
 c3
)";
    DiffHunk hunk = parseDiff(diff, "grid.txt").hunks.at(0);
    std::vector<int> changed;
    for (const DiffLine& line : hunk.lines) {
        if (line.mode() != EQ) changed.push_back(line.line_index);
    }
    ASSERT_EQ(changed.size(), 6);

    for (PatchDirection direction : {PATCH_FORWARD, PATCH_REVERSE}) {
        for (unsigned mask = 1; mask < (1u << changed.size()); mask++) {
            std::set<int> selected;
            for (size_t bit = 0; bit < changed.size(); bit++) {
                if (mask & (1u << bit)) selected.insert(changed[bit]);
            }

            LinePatch patch = buildLinePatch(hunk, selected, direction);
            int old_count = 0, new_count = 0;
            for (const std::string& line : patch.body) {
                if (line[0] == ' ' || line[0] == '-') old_count++;
                if (line[0] == ' ' || line[0] == '+') new_count++;
            }
            EXPECT_EQ(patch.old_count, old_count) << "mask " << mask;
            EXPECT_EQ(patch.new_count, new_count) << "mask " << mask;
            EXPECT_EQ(patch.old_start, 4);
            EXPECT_EQ(patch.new_start, 4);

            // every selected change survives with its own marker
            int changes = 0;
            for (const std::string& line : patch.body) {
                if (line[0] != ' ') changes++;
            }
            EXPECT_EQ(changes, static_cast<int>(selected.size())) << "mask " << mask;
        }
    }
}

TEST_F(PatchBuilderTest, ForwardDropsUnselectedAdditions) {
    LinePatch patch = buildLinePatch(scenarioHunk(), {3}, PATCH_FORWARD);
    std::vector<std::string> expected = {" unchanged1", " removed_line", "+added_line_B", " unchanged2"};
    EXPECT_EQ(patch.body, expected);
}

TEST_F(PatchBuilderTest, ReverseKeepsUnselectedAdditionsAsContext) {
    // discarding only the removal: the working tree holds the added lines
    LinePatch patch = buildLinePatch(scenarioHunk(), {1}, PATCH_REVERSE);
    std::vector<std::string> expected = {" unchanged1", "-removed_line", " added_line_A", " added_line_B", " unchanged2"};
    EXPECT_EQ(patch.body, expected);
    EXPECT_EQ(hunkHeader(patch), "@@ -10,5 +10,4 @@");
}

TEST_F(PatchBuilderTest, ReverseDropsUnselectedDeletions) {
    LinePatch patch = buildLinePatch(scenarioHunk(), {2}, PATCH_REVERSE);
    std::vector<std::string> expected = {" unchanged1", "+added_line_A", " added_line_B", " unchanged2"};
    EXPECT_EQ(patch.body, expected);
    EXPECT_EQ(hunkHeader(patch), "@@ -10,3 +10,4 @@");
}

TEST_F(PatchBuilderTest, UntrackedSubsetAsNewFile) {
    FileDiff file = synthesizeUntrackedDiff("todo.txt", "one\ntwo\nthree\nfour\nfive\n");
    std::string patch = createLinePatch("todo.txt", file.hunks.at(0), {0, 3}, PATCH_FORWARD, STATUS_UNTRACKED);

    EXPECT_EQ(patch,
              "diff --git a/todo.txt b/todo.txt\n"
              "new file mode 100644\n"
              "--- /dev/null\n"
              "+++ b/todo.txt\n"
              "@@ -0,0 +1,2 @@\n"
              "+one\n"
              "+four\n");
}

TEST_F(PatchBuilderTest, ZeroStartWithLinesIsMovedToOne) {
    FileDiff file = synthesizeUntrackedDiff("todo.txt", "one\ntwo\nthree\n");
    LinePatch patch = buildLinePatch(file.hunks.at(0), {1}, PATCH_REVERSE);
    EXPECT_EQ(hunkHeader(patch), "@@ -1,2 +1,3 @@");
}

TEST_F(PatchBuilderTest, KeepsNoNewlineMarker) {
    const std::string diff = "diff --git a/n.txt b/n.txt\n"
                             "--- a/n.txt\n"
                             "+++ b/n.txt\n"
                             "@@ -1,2 +1,3 @@\n"
                             " first\n"
                             "+middle\n"
                             " last\n"
                             "\\ No newline at end of file\n";
    DiffHunk hunk = parseDiff(diff, "n.txt").hunks.at(0);
    LinePatch patch = buildLinePatch(hunk, {1});
    std::vector<std::string> expected = {" first", "+middle", " last", "\\ No newline at end of file"};
    EXPECT_EQ(patch.body, expected);
    EXPECT_EQ(patch.old_count, 2);
    EXPECT_EQ(patch.new_count, 3);
}

class FileHeaderTest : public PatchBuilderTest {
protected:
    const std::string deleted_diff = R"(diff --git a/d.txt b/d.txt
deleted file mode 100644
index 5555555..0000000
--- a/d.txt
+++ /dev/null
@@ -1,3 +0,0 @@
-one
-two
-three
)";

    const std::string added_diff = R"(diff --git a/n.txt b/n.txt
new file mode 100755
index 0000000..5555555
--- /dev/null
+++ b/n.txt
@@ -0,0 +1,2 @@
+alpha
+beta
)";

    // everything from the first "---" line on
    static std::string fromFileHeader(const std::string& patch) {
        return patch.substr(patch.find("\n---") + 1);
    }
};

TEST_F(FileHeaderTest, RemovingEveryLineOfDeletedFileDeletesIt) {
    FileDiff file = parseDiff(deleted_diff, "d.txt");
    std::string patch = createLinePatch("d.txt", file.hunks.at(0), {0, 1, 2}, PATCH_FORWARD,
                                        file.status, file.file_mode);

    EXPECT_EQ(patch,
              "diff --git a/d.txt b/d.txt\n"
              "deleted file mode 100644\n"
              "--- a/d.txt\n"
              "+++ /dev/null\n"
              "@@ -1,3 +0,0 @@\n"
              "-one\n"
              "-two\n"
              "-three\n");
    EXPECT_EQ(fromFileHeader(patch), fromFileHeader(file.hunks[0].raw_patch));
}

TEST_F(FileHeaderTest, RemovingSomeLinesOfDeletedFileKeepsIt) {
    FileDiff file = parseDiff(deleted_diff, "d.txt");
    LinePatch patch = buildLinePatch(file.hunks.at(0), {0}, PATCH_FORWARD);

    EXPECT_EQ(fileHeaderKind(file.status, patch), HEADER_MODIFIED);
    EXPECT_EQ(hunkHeader(patch), "@@ -1,3 +1,2 @@");
}

TEST_F(FileHeaderTest, ReverseOfDeletedFileRecreatesIt) {
    FileDiff file = parseDiff(deleted_diff, "d.txt");
    LinePatch patch = buildLinePatch(file.hunks.at(0), {1}, PATCH_REVERSE);

    EXPECT_EQ(fileHeaderKind(file.status, patch), HEADER_DELETED_FILE);
    std::vector<std::string> expected = {"-two"};
    EXPECT_EQ(patch.body, expected);
    EXPECT_EQ(hunkHeader(patch), "@@ -1,1 +0,0 @@");
}

TEST_F(FileHeaderTest, ReverseOfEveryLineOfAddedFileRemovesIt) {
    FileDiff file = parseDiff(added_diff, "n.txt");
    std::string patch = createLinePatch("n.txt", file.hunks.at(0), {0, 1}, PATCH_REVERSE,
                                        file.status, file.file_mode);

    EXPECT_EQ(patch,
              "diff --git a/n.txt b/n.txt\n"
              "new file mode 100755\n"
              "--- /dev/null\n"
              "+++ b/n.txt\n"
              "@@ -0,0 +1,2 @@\n"
              "+alpha\n"
              "+beta\n");
    EXPECT_EQ(fromFileHeader(patch), fromFileHeader(file.hunks[0].raw_patch));
}

TEST_F(FileHeaderTest, ReverseOfSomeLinesOfAddedFileKeepsIt) {
    FileDiff file = parseDiff(added_diff, "n.txt");
    LinePatch patch = buildLinePatch(file.hunks.at(0), {1}, PATCH_REVERSE);

    EXPECT_EQ(fileHeaderKind(file.status, patch), HEADER_MODIFIED);
    EXPECT_EQ(hunkHeader(patch), "@@ -1,1 +1,2 @@");
}

TEST_F(FileHeaderTest, ModifiedFileNeverGetsDevNull) {
    LinePatch patch = buildLinePatch(scenarioHunk(), {1, 2, 3}, PATCH_FORWARD);
    EXPECT_EQ(fileHeaderKind(STATUS_MODIFIED, patch), HEADER_MODIFIED);
    EXPECT_EQ(fileHeaderKind(STATUS_RENAMED, patch), HEADER_MODIFIED);
}
