// =================================================================
// tests/ProjectScannerTest.cpp
// =================================================================
// Unit tests for ProjectScanner, IgnorePattern and TreeBuilder components.

#include "GenContext/ProjectScanner.hpp"
#include "GenContext/IgnorePattern.hpp"
#include "GenContext/TreeBuilder.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>
#include <vector>
#include <algorithm>

namespace fs = std::filesystem;

static void writeFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream(path) << content;
}

static std::vector<std::string> relativePaths(const std::vector<GenContext::ScanEntry>& entries) {
    std::vector<std::string> paths;
    for (const auto& entry : entries) {
        paths.push_back(entry.relative_path.generic_string());
    }
    return paths;
}

static bool contains(const std::vector<std::string>& paths, const std::string& path) {
    return std::find(paths.begin(), paths.end(), path) != paths.end();
}

static const GenContext::ScanEntry* findEntry(const std::vector<GenContext::ScanEntry>& entries,
                                              const std::string& relative) {
    for (const auto& entry : entries) {
        if (entry.relative_path.generic_string() == relative) {
            return &entry;
        }
    }
    return nullptr;
}

class ProjectScannerTest {
private:
    fs::path test_dir;

    void setupTestFiles() {
        cleanupTestFiles();
        writeFile(test_dir / ".gitignore", "# build output\nbuild/\n*.log\n!keep.log\n");
        writeFile(test_dir / "src/main.py", "print('hello')\n");
        writeFile(test_dir / "src/util.py", "def helper(): pass\n");
        writeFile(test_dir / "build/output.o", "binary data");
        writeFile(test_dir / "app.log", "log line\n");
        writeFile(test_dir / "keep.log", "kept\n");
        writeFile(test_dir / "docs/README.md", "# Documentation\n");
        writeFile(test_dir / ".git/config", "[core]\n");
        writeFile(test_dir / ".env", "SECRET=1\n");
    }

    void cleanupTestFiles() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

public:
    ProjectScannerTest() : test_dir(fs::temp_directory_path() / "gencontext_project_scanner") {}

    void testBasicScanning() {
        std::cout << "Testing basic scanning..." << std::endl;

        setupTestFiles();

        GenContext::IgnoreMatcher matcher;
        GenContext::ProjectScanner scanner(test_dir.string(), matcher);
        auto paths = relativePaths(scanner.scan());

        assert(contains(paths, "src") && "Should list the src directory");
        assert(contains(paths, "src/main.py") && "Should find src/main.py");
        assert(contains(paths, "docs/README.md") && "Should find docs/README.md");
        assert(contains(paths, "keep.log") && "Negated pattern should re-include keep.log");

        assert(!contains(paths, "app.log") && "Should ignore *.log");
        assert(!contains(paths, "build") && "Should prune ignored build directory");
        assert(!contains(paths, "build/output.o") && "Should not descend into build/");
        assert(!contains(paths, ".env") && "Should skip hidden files");
        assert(!contains(paths, ".gitignore") && "Rule file is a hidden file");

        cleanupTestFiles();
        std::cout << "✓ Basic scanning test passed" << std::endl;
    }

    void testHiddenDirectoriesPruned() {
        std::cout << "Testing hidden directory pruning..." << std::endl;

        setupTestFiles();

        // Hidden directories stay pruned even when ignored files are included
        GenContext::IgnoreMatcher matcher(".", true);
        GenContext::ProjectScanner scanner(test_dir.string(), matcher);
        auto paths = relativePaths(scanner.scan());

        for (const auto& path : paths) {
            assert(path.find(".git/") == std::string::npos && "Should never enter .git");
            assert(path != ".git" && "Should not list .git");
        }
        assert(contains(paths, "build/output.o") && "include_ignored should keep ignored directories");
        assert(contains(paths, "app.log") && "include_ignored should keep ignored files");
        assert(contains(paths, ".env") && "include_ignored should keep hidden files");

        cleanupTestFiles();
        std::cout << "✓ Hidden directory pruning test passed" << std::endl;
    }

    void testSortedOrder() {
        std::cout << "Testing sorted walk order..." << std::endl;

        cleanupTestFiles();
        writeFile(test_dir / "z.txt", "z\n");
        writeFile(test_dir / "b/c.py", "c = 1\n");
        writeFile(test_dir / "a.py", "a = 1\n");

        GenContext::IgnoreMatcher matcher;
        GenContext::ProjectScanner scanner(test_dir.string(), matcher, ".gitignore",
                                           GenContext::WalkOrder::SORTED);
        auto entries = scanner.scan();
        auto paths = relativePaths(entries);

        std::vector<std::string> expected = {"a.py", "b", "b/c.py", "z.txt"};
        assert(paths == expected && "Pre-order walk in lexicographic order");
        assert(entries[1].is_directory && "b is a directory");
        assert(entries[2].depth == 1 && "b/c.py is one level deep");

        cleanupTestFiles();
        std::cout << "✓ Sorted walk order test passed" << std::endl;
    }

    void testRelatedRoots() {
        std::cout << "Testing primary and related root classification..." << std::endl;

        cleanupTestFiles();
        writeFile(test_dir / ".gitignore", "*.tmp\n");
        writeFile(test_dir / "a.py", "def f(x, y): pass\n");
        writeFile(test_dir / "vendor/.gitignore", "\n");
        writeFile(test_dir / "vendor/b.py", "class C: pass\n");
        writeFile(test_dir / "vendor/sub/c.py", "x = 1\n");

        GenContext::IgnoreMatcher matcher;
        GenContext::ProjectScanner scanner(test_dir.string(), matcher);
        auto entries = scanner.scan();

        assert(scanner.getPrimaryRoot() == fs::path(GenContext::IgnoreMatcher::normalize(test_dir)) &&
               "First rule set marks the primary root");
        assert(scanner.getRelatedRoots().size() == 1 && "vendor is the only related root");

        const auto* a = findEntry(entries, "a.py");
        const auto* b = findEntry(entries, "vendor/b.py");
        const auto* c = findEntry(entries, "vendor/sub/c.py");
        assert(a && b && c && "All files should be scanned");
        assert(a->role == GenContext::TreeRole::PRIMARY && "a.py is in the primary tree");
        assert(b->role == GenContext::TreeRole::RELATED && "vendor/b.py is in a related tree");
        assert(c->role == GenContext::TreeRole::RELATED && "Nested files of a related tree are related");
        assert(matcher.ruleSets().size() == 2 && "Both rule files should be discovered");

        cleanupTestFiles();
        std::cout << "✓ Related root classification test passed" << std::endl;
    }

    void testFirstRuleSetBelowRoot() {
        std::cout << "Testing primary root below the scan root..." << std::endl;

        cleanupTestFiles();
        writeFile(test_dir / "top.py", "x = 1\n");
        writeFile(test_dir / "repo/.gitignore", "\n");
        writeFile(test_dir / "repo/lib.py", "y = 2\n");

        GenContext::IgnoreMatcher matcher;
        GenContext::ProjectScanner scanner(test_dir.string(), matcher);
        auto entries = scanner.scan();

        assert(scanner.getRelatedRoots().empty() && "A single rule file never creates a related root");
        for (const auto& entry : entries) {
            assert(entry.role == GenContext::TreeRole::PRIMARY && "Everything is primary");
        }

        cleanupTestFiles();
        std::cout << "✓ Primary root below scan root test passed" << std::endl;
    }

    void testOrderDependence() {
        std::cout << "Testing order dependence of rule discovery..." << std::endl;

        cleanupTestFiles();
        writeFile(test_dir / "gen/out.tmp", "generated\n");
        writeFile(test_dir / ".gitignore", "*.tmp\n");

        fs::path file = test_dir / "gen/out.tmp";
        GenContext::IgnoreMatcher matcher;

        assert(!matcher.isExcluded(file) && "Not excluded before any rule set is known");
        bool discovered = matcher.discoverRuleSet(test_dir, ".gitignore");
        assert(discovered && "Root rule file should be discovered");
        assert(matcher.isExcluded(file) && "Excluded once the rule set is known");

        // A rule set only affects paths below its own directory
        writeFile(test_dir / "sub/.gitignore", "*.md\n");
        writeFile(test_dir / "notes.md", "top\n");
        writeFile(test_dir / "sub/notes.md", "nested\n");
        discovered = matcher.discoverRuleSet(test_dir / "sub", ".gitignore");
        assert(discovered);
        assert(!matcher.isExcluded(test_dir / "notes.md") && "Nested rule does not reach its parent");
        assert(matcher.isExcluded(test_dir / "sub/notes.md") && "Nested rule applies below its directory");

        cleanupTestFiles();
        std::cout << "✓ Order dependence test passed" << std::endl;
    }

    void testDenyList() {
        std::cout << "Testing deny list..." << std::endl;

        cleanupTestFiles();
        writeFile(test_dir / "secret.txt", "s\n");
        writeFile(test_dir / "docs/notes.md", "n\n");
        writeFile(test_dir / "docs/guide.md", "g\n");
        writeFile(test_dir / "vendor/docs/notes.md", "v\n");
        writeFile(test_dir / "node_modules/pkg/index.js", "js\n");

        GenContext::IgnoreMatcher matcher(".", true, {"secret.txt", "docs/notes.md", "node_modules"});
        GenContext::ProjectScanner scanner(test_dir.string(), matcher);
        auto paths = relativePaths(scanner.scan());

        assert(!contains(paths, "secret.txt") && "Deny list matches base names");
        assert(!contains(paths, "docs/notes.md") && "Deny list matches relative paths");
        assert(contains(paths, "docs/guide.md") && "Other files are kept");
        assert(contains(paths, "vendor/docs/notes.md") && "Path entries only match from the root");
        assert(!contains(paths, "node_modules") && "Denied directories are pruned");
        assert(!contains(paths, "node_modules/pkg/index.js") && "Denied directories are not entered");

        GenContext::IgnoreMatcher nested(".", false, {"vendor/docs/"});
        GenContext::ProjectScanner nested_scanner(test_dir.string(), nested);
        paths = relativePaths(nested_scanner.scan());
        assert(!contains(paths, "vendor/docs") && "Trailing separator names a root-relative directory");
        assert(contains(paths, "docs/notes.md"));

        cleanupTestFiles();
        std::cout << "✓ Deny list test passed" << std::endl;
    }

    void testLinkedDirectoryNotFollowed() {
        std::cout << "Testing linked directories..." << std::endl;

        cleanupTestFiles();
        writeFile(test_dir / "real/file.py", "x = 1\n");

        std::error_code ec;
        fs::create_directory_symlink(test_dir / "real", test_dir / "link", ec);
        if (ec) {
            std::cout << "  (symlinks unsupported here, skipped)" << std::endl;
            cleanupTestFiles();
            return;
        }

        GenContext::IgnoreMatcher matcher;
        GenContext::ProjectScanner scanner(test_dir.string(), matcher);
        auto paths = relativePaths(scanner.scan());

        assert(contains(paths, "real/file.py") && "Real directory is walked");
        assert(!contains(paths, "link/file.py") && "Linked directory is not entered");

        cleanupTestFiles();
        std::cout << "✓ Linked directory test passed" << std::endl;
    }

    void testMissingRoot() {
        std::cout << "Testing missing root..." << std::endl;

        cleanupTestFiles();
        GenContext::IgnoreMatcher matcher;
        GenContext::ProjectScanner scanner((test_dir / "missing").string(), matcher);

        bool threw = false;
        try {
            scanner.scan();
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw && "Scanning a missing root should throw");

        std::cout << "✓ Missing root test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ProjectScanner unit tests..." << std::endl;

        testBasicScanning();
        testHiddenDirectoriesPruned();
        testSortedOrder();
        testRelatedRoots();
        testFirstRuleSetBelowRoot();
        testOrderDependence();
        testDenyList();
        testLinkedDirectoryNotFollowed();
        testMissingRoot();

        std::cout << "All ProjectScanner tests passed!" << std::endl;
    }
};

class IgnorePatternTest {
public:
    void testBasicMatching() {
        std::cout << "Testing basic pattern matching..." << std::endl;

        GenContext::IgnorePattern pattern("*.txt", "/proj");

        assert(pattern.matches("/proj/file.txt") && "Should match *.txt pattern");
        assert(!pattern.matches("/proj/file.cpp") && "Should not match non-txt files");
        assert(pattern.matches("/proj/path/to/file.txt") && "Star crosses separators");
        assert(!pattern.matches("/other/file.txt") && "Pattern is scoped to its directory");

        std::cout << "✓ Basic matching test passed" << std::endl;
    }

    void testDirectoryMatching() {
        std::cout << "Testing directory pattern matching..." << std::endl;

        GenContext::IgnorePattern pattern("build/", "/proj");

        assert(pattern.isDirectoryOnly());
        assert(pattern.matches("/proj/build", true) && "Should match directory itself");
        assert(!pattern.matches("/proj/build", false) && "Should not match a file named build");
        assert(pattern.matches("/proj/build/file.o") && "Should match files in directory");
        assert(!pattern.matches("/proj/buildfile.txt") && "Should not match files starting with pattern");

        std::cout << "✓ Directory matching test passed" << std::endl;
    }

    void testWildcardsAndClasses() {
        std::cout << "Testing wildcards and character classes..." << std::endl;

        GenContext::IgnorePattern single("file?.c", "/proj");
        assert(single.matches("/proj/file1.c"));
        assert(!single.matches("/proj/file12.c") && "? matches exactly one character");
        assert(!single.matches("/proj/file/.c") && "? never matches a separator");

        GenContext::IgnorePattern negated_class("[!a]*.py", "/proj");
        assert(negated_class.matches("/proj/b.py"));
        assert(!negated_class.matches("/proj/a.py") && "[!a] excludes a");

        GenContext::IgnorePattern anchored("/docs", "/proj");
        assert(anchored.matches("/proj/docs") && "Leading slash anchors to the directory");

        GenContext::IgnorePattern comment("# just a comment", "/proj");
        assert(comment.isEmpty() && "Comments are not patterns");

        std::cout << "✓ Wildcard test passed" << std::endl;
    }

    void testNegationPatterns() {
        std::cout << "Testing negation patterns..." << std::endl;

        GenContext::IgnoreRuleSet rule_set("/proj");
        rule_set.addPattern("*.log");
        rule_set.addPattern("!keep.log");

        assert(rule_set.size() == 2);
        assert(rule_set.shouldIgnore("/proj/app.log") && "*.log should be ignored");
        assert(!rule_set.shouldIgnore("/proj/keep.log") && "Last matching pattern wins");
        assert(!rule_set.shouldIgnore("/elsewhere/app.log") && "Rule set is scoped to its directory");

        std::cout << "✓ Negation patterns test passed" << std::endl;
    }

    void testAncestorMatching() {
        std::cout << "Testing ancestor matching..." << std::endl;

        GenContext::IgnoreRuleSet rule_set("/proj");
        rule_set.addPattern("build");

        assert(rule_set.shouldIgnore("/proj/build/out.o") && "Files below a matched directory are ignored");
        assert(rule_set.shouldIgnore("/proj/build/deep/x.o"));
        assert(!rule_set.shouldIgnore("/proj/builder.txt") && "Prefix of a name is not a match");

        std::cout << "✓ Ancestor matching test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running IgnorePattern unit tests..." << std::endl;

        testBasicMatching();
        testDirectoryMatching();
        testWildcardsAndClasses();
        testNegationPatterns();
        testAncestorMatching();

        std::cout << "All IgnorePattern tests passed!" << std::endl;
    }
};

class TreeBuilderTest {
private:
    fs::path test_dir;

    void cleanupTestFiles() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

public:
    TreeBuilderTest() : test_dir(fs::temp_directory_path() / "gencontext_tree_builder") {}

    void testOneLinePerEntry() {
        std::cout << "Testing tree line count..." << std::endl;

        cleanupTestFiles();
        writeFile(test_dir / "a.py", "a = 1\n");
        writeFile(test_dir / "src/b.py", "b = 1\n");
        writeFile(test_dir / "src/c.py", "c = 1\n");
        writeFile(test_dir / ".git/objects/pack/data", "x");
        writeFile(test_dir / ".hidden/deep/x.py", "x = 1\n");

        GenContext::IgnoreMatcher matcher;
        GenContext::TreeNode tree = GenContext::TreeBuilder::build(test_dir.string(), matcher);
        auto lines = GenContext::TreeBuilder::formatTree(tree);

        std::string root_name = test_dir.filename().string();
        assert(tree.name == root_name && "Root is keyed by the directory's base name");
        assert(lines.size() == 5 && "Root, a.py, src/, b.py and c.py");
        assert(lines[0] == "├── " + root_name + "/");
        assert(lines[1] == "│   ├── a.py");
        assert(lines[2] == "│   ├── src/");
        assert(lines[3] == "│   │   ├── b.py");
        assert(lines[4] == "│   │   ├── c.py");

        cleanupTestFiles();
        std::cout << "✓ Tree line count test passed" << std::endl;
    }

    void testBuildFromEntries() {
        std::cout << "Testing tree construction from entries..." << std::endl;

        std::vector<GenContext::ScanEntry> entries(3);
        entries[0].relative_path = "pkg";
        entries[0].is_directory = true;
        entries[1].relative_path = "pkg/mod.py";
        entries[2].relative_path = "empty";
        entries[2].is_directory = true;

        GenContext::TreeNode tree = GenContext::TreeBuilder::build("project", entries);

        assert(tree.children.size() == 2);
        const GenContext::TreeNode* pkg = tree.find("pkg");
        assert(pkg && pkg->is_directory);
        assert(pkg->find("mod.py") && !pkg->find("mod.py")->is_directory);
        const GenContext::TreeNode* empty = tree.find("empty");
        assert(empty && empty->is_directory && empty->children.empty() && "Empty directories are kept");

        auto lines = GenContext::TreeBuilder::formatTree(tree);
        assert(lines.size() == 4);
        assert(lines[3] == "│   ├── empty/");

        std::cout << "✓ Tree construction test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running TreeBuilder unit tests..." << std::endl;

        testOneLinePerEntry();
        testBuildFromEntries();

        std::cout << "All TreeBuilder tests passed!" << std::endl;
    }
};

int main() {
    try {
        ProjectScannerTest scanner_tests;
        scanner_tests.runAllTests();

        std::cout << std::endl;

        IgnorePatternTest pattern_tests;
        pattern_tests.runAllTests();

        std::cout << std::endl;

        TreeBuilderTest tree_tests;
        tree_tests.runAllTests();

        std::cout << "\n🎉 All ProjectScanner component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
