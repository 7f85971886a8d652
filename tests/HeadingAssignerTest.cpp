// =================================================================
// tests/HeadingAssignerTest.cpp
// =================================================================
// Unit tests for heading text and anchor assignment.

#include "Folio/HeadingAssigner.hpp"
#include <iostream>
#include <cassert>

namespace fs = std::filesystem;

class HeadingAssignerTest {
private:
    const fs::path root_path{"/project"};

    std::unique_ptr<Folio::TreeNode> makeDirectory(const fs::path& path, size_t depth) {
        return std::make_unique<Folio::TreeNode>(path, true, depth);
    }

    std::unique_ptr<Folio::TreeNode> makeFile(const fs::path& path, size_t depth) {
        return std::make_unique<Folio::TreeNode>(path, false, depth, path.extension() == ".md");
    }

    // project/
    //   a-b/Notes.md
    //   a_b/Notes.md
    //   main.py
    std::unique_ptr<Folio::TreeNode> makeCollidingTree() {
        auto root = makeDirectory(root_path, 0);

        auto dashed = makeDirectory(root_path / "a-b", 1);
        dashed->children.push_back(makeFile(root_path / "a-b" / "Notes.md", 2));

        auto underscored = makeDirectory(root_path / "a_b", 1);
        underscored->children.push_back(makeFile(root_path / "a_b" / "Notes.md", 2));

        root->children.push_back(std::move(dashed));
        root->children.push_back(std::move(underscored));
        root->children.push_back(makeFile(root_path / "main.py", 1));
        return root;
    }

public:
    void testHeadingText() {
        std::cout << "Testing heading text..." << std::endl;

        auto root = makeCollidingTree();
        Folio::AnchorRegistry registry;
        Folio::HeadingAssigner assigner(root_path, registry);
        assigner.assign(*root);

        assert(root->heading_text.empty() && root->anchor.empty() && "The root keeps no heading");
        assert(!root->hasHeading());

        assert(root->children[0]->heading_text == "a-b/" && "Directories end with a slash");
        assert(root->children[0]->children[0]->heading_text == "a-b/Notes.md");
        assert(root->children[2]->heading_text == "main.py");
        assert(root->children[2]->anchor == "mainpy");

        std::cout << "✓ Heading text test passed" << std::endl;
    }

    void testPreOrderCollisions() {
        std::cout << "Testing pre-order anchor registration..." << std::endl;

        auto root = makeCollidingTree();
        Folio::AnchorRegistry registry;
        Folio::HeadingAssigner assigner(root_path, registry);
        assigner.assign(*root);

        const Folio::TreeNode& dashed = *root->children[0];
        const Folio::TreeNode& underscored = *root->children[1];

        assert(dashed.anchor == "a-b");
        assert(dashed.children[0]->anchor == "a-b-notesmd");
        assert(underscored.anchor == "a-b-1" && "Second directory with the same slug gets a suffix");
        assert(underscored.children[0]->anchor == "a-b-notesmd-1");

        assert(assigner.getAssignedCount() == 5);
        assert(registry.size() == 5);

        std::cout << "✓ Pre-order anchor registration test passed" << std::endl;
    }

    void testDeepNesting() {
        std::cout << "Testing deeply nested paths..." << std::endl;

        auto root = makeDirectory(root_path, 0);
        fs::path current = root_path;
        Folio::TreeNode* parent = root.get();
        for (size_t depth = 1; depth <= 7; ++depth) {
            current /= "d" + std::to_string(depth);
            parent->children.push_back(makeDirectory(current, depth));
            parent = parent->children.back().get();
        }
        parent->children.push_back(makeFile(current / "leaf.py", 8));

        Folio::AnchorRegistry registry;
        Folio::HeadingAssigner assigner(root_path, registry);
        assigner.assign(*root);

        const Folio::TreeNode& leaf = *parent->children[0];
        assert(leaf.heading_text == "d1/d2/d3/d4/d5/d6/d7/leaf.py");
        assert(leaf.anchor == "d1-d2-d3-d4-d5-d6-d7-leafpy");
        assert(assigner.getAssignedCount() == 8);

        std::cout << "✓ Deeply nested paths test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running HeadingAssigner unit tests..." << std::endl;

        testHeadingText();
        testPreOrderCollisions();
        testDeepNesting();

        std::cout << "All HeadingAssigner tests passed!" << std::endl;
    }
};

int main() {
    try {
        HeadingAssignerTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
