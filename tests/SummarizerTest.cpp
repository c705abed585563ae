// =================================================================
// tests/SummarizerTest.cpp
// =================================================================
// Unit tests for the Python declaration digest.

#include "GenContext/PythonSummarizer.hpp"
#include "GenContext/Summarizer.hpp"
#include <iostream>
#include <cassert>
#include <memory>
#include <string>

static bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

class SummarizerTest {
private:
    GenContext::PythonSummarizer summarizer;

public:
    void testClassWithDocstring() {
        std::cout << "Testing class digest..." << std::endl;

        std::string source = "class C(Base):\n    \"\"\"doc\"\"\"\n    def g(self): pass\n";
        std::string digest = summarizer.summarize(source);

        assert(digest == "class C(Base):\n    \"\"\"doc\"\"\"\n    def g(self):" && "Bases, docstring and method");

        std::cout << "✓ Class digest test passed" << std::endl;
    }

    void testOmitSelf() {
        std::cout << "Testing self parameter suppression..." << std::endl;

        GenContext::SignatureOptions options;
        options.omit_self = true;
        GenContext::PythonSummarizer omitting(options);

        std::string source = "class C(Base):\n    def g(self, x): pass\n";
        assert(omitting.summarize(source) == "class C(Base):\n    def g(x):");
        assert(summarizer.summarize(source) == "class C(Base):\n    def g(self, x):" && "Kept by default");

        std::cout << "✓ Self parameter test passed" << std::endl;
    }

    void testSignatures() {
        std::cout << "Testing signature reconstruction..." << std::endl;

        std::string source =
            "async def fetch(url, *args, timeout: int = 3, **kwargs) -> None:\n"
            "    pass\n"
            "\n"
            "def split(a, /, b, *, c=1):\n"
            "    return a\n"
            "\n"
            "def typed(x: int, *rest: str):\n"
            "    pass\n";
        std::string digest = summarizer.summarize(source);

        assert(digest ==
               "async def fetch(url, *args, timeout, **kwargs):\n"
               "def split(a, b, c):\n"
               "def typed(x, *rest):" && "Annotations, defaults and separators are dropped");

        std::cout << "✓ Signature test passed" << std::endl;
    }

    void testClassFields() {
        std::cout << "Testing class field declarations..." << std::endl;

        std::string source =
            "class Point(Base, metaclass=Meta):\n"
            "    x: int\n"
            "    y: str = 'a'\n"
            "    a = b = 1\n"
            "    count = 0\n"
            "    count += 1\n"
            "    def norm(self):\n"
            "        total = 0\n"
            "        return total\n";
        std::string digest = summarizer.summarize(source);

        assert(digest ==
               "class Point(Base):\n"
               "    x: int\n"
               "    y: str = ...\n"
               "    a = b = ...\n"
               "    count = ...\n"
               "    def norm(self):" && "Fields of class bodies only, keyword bases dropped");

        std::cout << "✓ Class field test passed" << std::endl;
    }

    void testNestingAndBlocks() {
        std::cout << "Testing nested declarations..." << std::endl;

        std::string source =
            "import os\n"
            "VERSION = '1.0'\n"
            "\n"
            "class Outer:\n"
            "    class Inner:\n"
            "        def deep(self): pass\n"
            "\n"
            "def outer():\n"
            "    def inner(): pass\n"
            "    return inner\n"
            "\n"
            "if os.name == 'posix':\n"
            "    def posix_only(): pass\n"
            "else:\n"
            "    def other(): pass\n"
            "\n"
            "@decorator\n"
            "def decorated(a): pass\n";
        std::string digest = summarizer.summarize(source);

        assert(digest ==
               "class Outer:\n"
               "    class Inner:\n"
               "        def deep(self):\n"
               "def outer():\n"
               "    def inner():\n"
               "def posix_only():\n"
               "def other():\n"
               "def decorated(a):" && "Depth follows declarations, not control flow");

        std::cout << "✓ Nesting test passed" << std::endl;
    }

    void testMultiLineDocstring() {
        std::cout << "Testing multi-line docstrings..." << std::endl;

        std::string source =
            "def f():\n"
            "    \"\"\"Summary.\n"
            "\n"
            "    Details here.\n"
            "    \"\"\"\n"
            "    return 1\n";
        std::string digest = summarizer.summarize(source);

        assert(digest ==
               "def f():\n"
               "    \"\"\"Summary.\n"
               "\n"
               "    Details here.\"\"\"" && "Continuation lines keep the docstring indentation");

        std::cout << "✓ Multi-line docstring test passed" << std::endl;
    }

    void testNonDocstringLiterals() {
        std::cout << "Testing literals that are not docstrings..." << std::endl;

        assert(summarizer.summarize("def f():\n    b\"bytes\"\n") == "def f():");
        assert(summarizer.summarize("def f():\n    f\"{x}\"\n") == "def f():");
        assert(summarizer.summarize("def f():\n    x = 1\n    \"\"\"late\"\"\"\n") == "def f():");
        assert(summarizer.summarize("def f():\n    \"\"\"\"\"\"\n") == "def f():" && "An empty docstring is dropped");
        assert(summarizer.summarize("class C:\n    '   '\n    x = 1\n") == "class C:\n    x = ..." &&
               "A blank docstring is dropped");
        assert(summarizer.summarize("def f():\n    r'raw \\n text'\n") == "def f():\n    \"\"\"raw \\n text\"\"\"");

        std::cout << "✓ Non-docstring literal test passed" << std::endl;
    }

    void testParseError() {
        std::cout << "Testing parse error marker..." << std::endl;

        std::string digest = summarizer.summarize("def broken(:\n    return )\n");

        assert(startsWith(digest, "# SyntaxError while parsing: ") && "Parse failure becomes a marker");
        assert(digest.find("line ") != std::string::npos && "Marker names the position");
        assert(digest.find('\n') == std::string::npos && "Marker is a single line");

        std::cout << "✓ Parse error test passed" << std::endl;
    }

    void testIdempotence() {
        std::cout << "Testing summarizing a digest..." << std::endl;

        std::string source = "class C(Base):\n    \"\"\"doc\"\"\"\n    def g(self): pass\n";
        std::string first = summarizer.summarize(source);

        std::string second;
        bool threw = false;
        try {
            second = summarizer.summarize(first);
            summarizer.summarize(second);
        } catch (const std::exception&) {
            threw = true;
        }
        assert(!threw && "Summarizing a digest never throws");
        assert(!second.empty());

        std::cout << "✓ Idempotence test passed" << std::endl;
    }

    void testEmptySource() {
        std::cout << "Testing empty source..." << std::endl;

        assert(summarizer.summarize("").empty());
        assert(summarizer.summarize("x = 1\nprint(x)\n").empty() && "Module statements are not declarations");

        std::cout << "✓ Empty source test passed" << std::endl;
    }

    void testCleanDocstring() {
        std::cout << "Testing docstring cleaning..." << std::endl;

        using GenContext::PythonSummarizer;
        assert(PythonSummarizer::cleanDocstring("  doc  ") == "doc  ");
        assert(PythonSummarizer::cleanDocstring("\n    First\n      Indented\n    ") == "First\n  Indented");
        assert(PythonSummarizer::cleanDocstring("A\n\tB") == "A\nB" && "Tabs expand before the margin is removed");
        assert(PythonSummarizer::cleanDocstring("   \n  \n").empty());

        std::cout << "✓ Docstring cleaning test passed" << std::endl;
    }

    void testDecodeStringLiteral() {
        std::cout << "Testing string literal decoding..." << std::endl;

        using GenContext::PythonSummarizer;
        std::string value;

        assert(PythonSummarizer::decodeStringLiteral("'a\\tb'", value) && value == "a\tb");
        assert(PythonSummarizer::decodeStringLiteral("r'a\\tb'", value) && value == "a\\tb");
        assert(PythonSummarizer::decodeStringLiteral("u\"\"\"x\"\"\"", value) && value == "x");
        assert(PythonSummarizer::decodeStringLiteral("'\\u00e9'", value) && value == "\xc3\xa9");
        assert(!PythonSummarizer::decodeStringLiteral("b'x'", value) && "Bytes are not text");
        assert(!PythonSummarizer::decodeStringLiteral("rb'x'", value));
        assert(!PythonSummarizer::decodeStringLiteral("F'x'", value) && "f-strings are not constant");

        std::cout << "✓ String literal test passed" << std::endl;
    }

    void testRegistry() {
        std::cout << "Testing summarizer registry..." << std::endl;

        GenContext::SummarizerRegistry registry;
        assert(registry.find("module.py") == nullptr && "Empty registry supports nothing");

        registry.add(std::make_unique<GenContext::PythonSummarizer>());
        assert(registry.size() == 1);
        assert(registry.isSourceFile("pkg/module.py"));
        assert(registry.isSourceFile("stubs/module.pyi"));
        assert(!registry.isSourceFile("README.md"));
        assert(registry.find("a.py")->name() == "python");

        std::cout << "✓ Registry test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Summarizer unit tests..." << std::endl;

        testClassWithDocstring();
        testOmitSelf();
        testSignatures();
        testClassFields();
        testNestingAndBlocks();
        testMultiLineDocstring();
        testNonDocstringLiterals();
        testParseError();
        testIdempotence();
        testEmptySource();
        testCleanDocstring();
        testDecodeStringLiteral();
        testRegistry();

        std::cout << "All Summarizer tests passed!" << std::endl;
    }
};

int main() {
    try {
        SummarizerTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All Summarizer tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
