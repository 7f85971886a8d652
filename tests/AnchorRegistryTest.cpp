// =================================================================
// tests/AnchorRegistryTest.cpp
// =================================================================
// Unit tests for slug generation and collision handling.

#include "Folio/AnchorRegistry.hpp"
#include <iostream>
#include <set>
#include <cassert>

class AnchorRegistryTest {
public:
    void testSlugify() {
        std::cout << "Testing slugify..." << std::endl;

        assert(Folio::AnchorRegistry::slugify("src/main.cpp") == "src-maincpp");
        assert(Folio::AnchorRegistry::slugify("  Hello,  World!  ") == "hello-world");
        assert(Folio::AnchorRegistry::slugify("docs/") == "docs");
        assert(Folio::AnchorRegistry::slugify("my_module/__init__.py") == "my-module-init-py");
        assert(Folio::AnchorRegistry::slugify("a - b") == "a-b");
        assert(Folio::AnchorRegistry::slugify("--lead-and-trail--") == "lead-and-trail");
        assert(Folio::AnchorRegistry::slugify("README.MD") == "readmemd");
        assert(Folio::AnchorRegistry::slugify("v1.2 (final)") == "v12-final");
        assert(Folio::AnchorRegistry::slugify("").empty());
        assert(Folio::AnchorRegistry::slugify("!!!").empty());

        std::cout << "✓ Slugify test passed" << std::endl;
    }

    void testUnicodeSlugs() {
        std::cout << "Testing non-ASCII headings..." << std::endl;

        // Letters of any script are kept and lower-cased
        assert(Folio::AnchorRegistry::slugify("caf\xC3\xA9/men\xC3\xBA.md") == "caf\xC3\xA9-men\xC3\xBAmd");
        assert(Folio::AnchorRegistry::slugify("\xC3\x9C" "ber/Stra\xC3\x9F" "e.md") == "\xC3\xBC" "ber-stra\xC3\x9F" "emd");
        assert(Folio::AnchorRegistry::slugify("\xD0\x94\xD0\xBE\xD0\xBA.md") == "\xD0\xB4\xD0\xBE\xD0\xBAmd");

        // Non-ASCII punctuation and spacing are removed, not turned into hyphens
        assert(Folio::AnchorRegistry::slugify("docs/a\xE2\x80\x94" "b.md") == "docs-abmd" && "Em dash is dropped");
        assert(Folio::AnchorRegistry::slugify("docs/a\xC2\xA0" "b.md") == "docs-abmd" && "No-break space is dropped");
        assert(Folio::AnchorRegistry::slugify("\xC2\xAB" "quoted\xC2\xBB") == "quoted");

        // Combining marks are not word characters
        assert(Folio::AnchorRegistry::slugify("Cafe\xCC\x81") == "cafe");

        Folio::AnchorRegistry registry;
        assert(registry.registerHeading("\xC3\x9C" "ber.md") == "\xC3\xBC" "bermd");
        assert(registry.registerHeading("\xC3\xBC" "ber.md") == "\xC3\xBC" "bermd-1" && "Case variants collide");

        std::cout << "✓ Non-ASCII headings test passed" << std::endl;
    }

    void testDuplicateHeadings() {
        std::cout << "Testing duplicate headings..." << std::endl;

        Folio::AnchorRegistry registry;
        assert(registry.registerHeading("Notes.md") == "notesmd");
        assert(registry.registerHeading("Notes.md") == "notesmd-1");
        assert(registry.registerHeading("notes.MD") == "notesmd-2" && "Headings collide on their slug");
        assert(registry.size() == 3);

        std::cout << "✓ Duplicate headings test passed" << std::endl;
    }

    void testLiteralSuffixCollision() {
        std::cout << "Testing literal suffix collisions..." << std::endl;

        Folio::AnchorRegistry registry;
        assert(registry.registerHeading("a") == "a");
        assert(registry.registerHeading("a 1") == "a-1");
        assert(registry.registerHeading("a") == "a-2" && "Suffix skips the literal a-1");

        Folio::AnchorRegistry reversed;
        assert(reversed.registerHeading("a") == "a");
        assert(reversed.registerHeading("a") == "a-1");
        assert(reversed.registerHeading("a-1") == "a-1-1" && "Generated suffixes are reserved");

        std::cout << "✓ Literal suffix collisions test passed" << std::endl;
    }

    void testUniqueness() {
        std::cout << "Testing anchor uniqueness..." << std::endl;

        Folio::AnchorRegistry registry;
        std::set<std::string> seen;
        const char* headings[] = {"x", "x 1", "x", "x-2", "x", "X", "x_1", "x/", "x-1-1"};
        for (const char* heading : headings) {
            std::string anchor = registry.registerHeading(heading);
            assert(seen.insert(anchor).second && "Every anchor is handed out once");
        }
        assert(seen.size() == sizeof(headings) / sizeof(headings[0]));

        std::cout << "✓ Anchor uniqueness test passed" << std::endl;
    }

    void testEmptySlug() {
        std::cout << "Testing headings without slug characters..." << std::endl;

        Folio::AnchorRegistry registry;
        assert(registry.registerHeading("???").empty());
        assert(registry.registerHeading("...") == "-1");

        std::cout << "✓ Empty slug test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running AnchorRegistry unit tests..." << std::endl;

        testSlugify();
        testUnicodeSlugs();
        testDuplicateHeadings();
        testLiteralSuffixCollision();
        testUniqueness();
        testEmptySlug();

        std::cout << "All AnchorRegistry tests passed!" << std::endl;
    }
};

int main() {
    try {
        AnchorRegistryTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
