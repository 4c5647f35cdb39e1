//! # xUnit XML Decoder
//!
//! Walks the document with `xmlTextReader` and keeps the chain of open
//! elements as a '/'-joined path. Each element is handled according to the
//! path of its parent:
//!
//! | Parent path                          | Element                         |
//! |--------------------------------------|---------------------------------|
//! | (none)                               | assemblies                      |
//! | assemblies                           | assembly                        |
//! | assemblies/assembly                  | collection, errors              |
//! | assemblies/assembly/errors           | error                           |
//! | assemblies/assembly/collection       | test                            |
//! | .../collection/test                  | failure, output, reason         |
//! | .../collection/test/traits           | trait                           |
//! | .../collection/test/failure          | message, stack-trace            |
//! | .../collection/test/warnings         | warning                         |

#include "xunit/xml_decoder.hpp"

#include "log/log.hpp"

#include <charconv>
#include <cstdlib>
#include <memory>
#include <optional>
#include <vector>

#include <libxml/tree.h>
#include <libxml/xmlerror.h>
#include <libxml/xmlreader.h>

namespace testviz::xunit {

auto DecodeError::to_string() const -> std::string {
    if (line > 0) {
        return message + " (line " + std::to_string(line) + ")";
    }
    return message;
}

// ============================================================================
// Attribute Values
// ============================================================================

static auto trim(std::string_view text) -> std::string_view {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos)
        return {};
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

auto parse_int_attribute(std::string_view text, int& out) -> bool {
    auto value = trim(text);
    if (value.empty()) {
        out = 0;
        return true;
    }

    // from_chars rejects a leading '+'
    if (value.front() == '+')
        value.remove_prefix(1);

    int parsed = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size())
        return false;

    out = parsed;
    return true;
}

auto parse_double_attribute(std::string_view text, double& out) -> bool {
    std::string value(trim(text));
    if (value.empty()) {
        out = 0.0;
        return true;
    }

    char* end = nullptr;
    double parsed = std::strtod(value.c_str(), &end);
    if (end != value.c_str() + value.size())
        return false;

    out = parsed;
    return true;
}

namespace {

// ============================================================================
// Reader Helpers
// ============================================================================

using ReaderPtr = std::unique_ptr<xmlTextReader, decltype(&xmlFreeTextReader)>;

auto as_string(const xmlChar* text) -> std::string {
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

/// Copies and frees a string allocated by libxml2.
auto take_string(xmlChar* text) -> std::string {
    std::string result = as_string(text);
    if (text)
        xmlFree(text);
    return result;
}

auto last_parser_error(const char* fallback) -> DecodeError {
    const xmlError* error = xmlGetLastError();
    if (error && error->message) {
        std::string message = error->message;
        while (!message.empty() && (message.back() == '\n' || message.back() == ' ')) {
            message.pop_back();
        }
        return DecodeError{"malformed XML: " + message, error->line};
    }
    return DecodeError{fallback, 0};
}

// ============================================================================
// Document Builder
// ============================================================================

/// Fills a Document from reader events.
class DocumentBuilder {
public:
    explicit DocumentBuilder(xmlTextReaderPtr reader) : reader_(reader) {}

    /// Handles an element start; `parent` is the '/'-joined path of open elements.
    void on_element(const std::string& parent, const std::string& name);

    [[nodiscard]] auto has_root() const -> bool {
        return has_root_;
    }

    [[nodiscard]] auto error() const -> const std::optional<DecodeError>& {
        return error_;
    }

    [[nodiscard]] auto take_document() -> Document {
        return std::move(document_);
    }

private:
    xmlTextReaderPtr reader_;
    Document document_;
    bool has_root_ = false;
    std::optional<DecodeError> error_;

    [[nodiscard]] auto attribute(const char* name) const -> std::string {
        return take_string(xmlTextReaderGetAttribute(reader_, BAD_CAST name));
    }

    /// Text content of the current element, including CDATA sections.
    [[nodiscard]] auto text() const -> std::string {
        return take_string(xmlTextReaderReadString(reader_));
    }

    void read_int(const char* name, int& out);
    void read_double(const char* name, double& out);
    void fail(const std::string& message);

    [[nodiscard]] auto current_assembly() -> AssemblyElement& {
        return document_.assemblies.back();
    }

    [[nodiscard]] auto current_test() -> TestElement& {
        return current_assembly().collections.back().tests.back();
    }

    void read_root();
    void read_assembly();
    void read_collection();
    void read_test();
};

void DocumentBuilder::fail(const std::string& message) {
    if (!error_) {
        xmlNodePtr node = xmlTextReaderCurrentNode(reader_);
        int line = node ? static_cast<int>(xmlGetLineNo(node)) : 0;
        error_ = DecodeError{message, line > 0 ? line : 0};
    }
}

void DocumentBuilder::read_int(const char* name, int& out) {
    std::string value = attribute(name);
    if (!parse_int_attribute(value, out)) {
        fail("invalid integer '" + value + "' in attribute '" + name + "'");
    }
}

void DocumentBuilder::read_double(const char* name, double& out) {
    std::string value = attribute(name);
    if (!parse_double_attribute(value, out)) {
        fail("invalid number '" + value + "' in attribute '" + name + "'");
    }
}

void DocumentBuilder::read_root() {
    document_.id = attribute("id");
    document_.schema_version = attribute("schema-version");
    document_.computer = attribute("computer");
    document_.user = attribute("user");
    document_.start_rtf = attribute("start-rtf");
    document_.finish_rtf = attribute("finish-rtf");
    document_.timestamp = attribute("timestamp");
}

void DocumentBuilder::read_assembly() {
    AssemblyElement assembly;
    assembly.id = attribute("id");
    assembly.name = attribute("name");
    assembly.config_file = attribute("config-file");
    assembly.environment = attribute("environment");
    assembly.target_framework = attribute("target-framework");
    assembly.test_framework = attribute("test-framework");
    read_int("errors", assembly.errors);
    read_int("failed", assembly.failed);
    read_int("not-run", assembly.not_run);
    read_int("passed", assembly.passed);
    read_int("skipped", assembly.skipped);
    read_int("total", assembly.total);
    assembly.run_date = attribute("run-date");
    assembly.run_time = attribute("run-time");
    assembly.start_rtf = attribute("start-rtf");
    assembly.finish_rtf = attribute("finish-rtf");
    read_double("time", assembly.time);
    assembly.time_rtf = attribute("time-rtf");
    document_.assemblies.push_back(std::move(assembly));
}

void DocumentBuilder::read_collection() {
    CollectionElement collection;
    collection.id = attribute("id");
    collection.name = attribute("name");
    read_int("failed", collection.failed);
    read_int("not-run", collection.not_run);
    read_int("passed", collection.passed);
    read_int("skipped", collection.skipped);
    read_int("total", collection.total);
    collection.time = attribute("time");
    collection.time_rtf = attribute("time-rtf");
    current_assembly().collections.push_back(std::move(collection));
}

void DocumentBuilder::read_test() {
    TestElement test;
    test.id = attribute("id");
    test.name = attribute("name");
    test.type = attribute("type");
    test.method = attribute("method");
    test.result = attribute("result");
    test.source_file = attribute("source-file");
    test.source_line = attribute("source-line");
    read_double("time", test.time);
    test.time_rtf = attribute("time-rtf");
    current_assembly().collections.back().tests.push_back(std::move(test));
}

void DocumentBuilder::on_element(const std::string& parent, const std::string& name) {
    static const std::string ASSEMBLY = "assemblies/assembly";
    static const std::string TEST = "assemblies/assembly/collection/test";

    if (parent.empty()) {
        if (name != "assemblies") {
            fail("expected root element <assemblies> but found <" + name + ">");
            return;
        }
        has_root_ = true;
        read_root();
    } else if (parent == "assemblies" && name == "assembly") {
        read_assembly();
    } else if (parent == ASSEMBLY && name == "collection") {
        read_collection();
    } else if (parent == ASSEMBLY + "/errors" && name == "error") {
        current_assembly().environment_errors.push_back({attribute("name"), attribute("type")});
    } else if (parent == ASSEMBLY + "/collection" && name == "test") {
        read_test();
    } else if (parent == TEST + "/traits" && name == "trait") {
        current_test().traits.push_back({attribute("name"), attribute("value")});
    } else if (parent == TEST && name == "failure") {
        current_test().failure.exception_type = attribute("exception-type");
    } else if (parent == TEST + "/failure" && name == "message") {
        current_test().failure.message = text();
    } else if (parent == TEST + "/failure" && name == "stack-trace") {
        current_test().failure.stack_trace = text();
    } else if (parent == TEST && name == "output") {
        current_test().output = text();
    } else if (parent == TEST && name == "reason") {
        current_test().reason = text();
    } else if (parent == TEST + "/warnings" && name == "warning") {
        current_test().warnings.push_back(text());
    }
}

auto join_path(const std::vector<std::string>& open) -> std::string {
    std::string path;
    for (const auto& name : open) {
        if (!path.empty())
            path += '/';
        path += name;
    }
    return path;
}

} // namespace

// ============================================================================
// decode
// ============================================================================

auto decode(std::string_view xml) -> Result<Document, DecodeError> {
    xmlResetLastError();

    ReaderPtr reader(xmlReaderForMemory(xml.data(), static_cast<int>(xml.size()), "xunit.xml",
                                        nullptr,
                                        XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING |
                                            XML_PARSE_BIG_LINES),
                     &xmlFreeTextReader);
    if (!reader) {
        return DecodeError{"could not create an XML reader for the input", 0};
    }

    DocumentBuilder builder(reader.get());
    std::vector<std::string> open;

    int status = 0;
    while ((status = xmlTextReaderRead(reader.get())) == 1) {
        int type = xmlTextReaderNodeType(reader.get());

        if (type == XML_READER_TYPE_ELEMENT) {
            std::string name = as_string(xmlTextReaderConstLocalName(reader.get()));
            builder.on_element(join_path(open), name);
            if (builder.error()) {
                break;
            }
            // Self-closing elements produce no end event
            if (!xmlTextReaderIsEmptyElement(reader.get())) {
                open.push_back(std::move(name));
            }
        } else if (type == XML_READER_TYPE_END_ELEMENT && !open.empty()) {
            open.pop_back();
        }
    }

    if (builder.error()) {
        TESTVIZ_LOG_DEBUG("xunit", "Decode failed: " << builder.error()->to_string());
        return *builder.error();
    }
    if (status < 0) {
        auto error = last_parser_error("malformed XML");
        TESTVIZ_LOG_DEBUG("xunit", "Decode failed: " << error.to_string());
        return error;
    }
    if (!builder.has_root()) {
        return DecodeError{"document has no root element", 0};
    }

    auto document = builder.take_document();
    TESTVIZ_LOG_DEBUG("xunit", "Decoded document with " << document.assemblies.size()
                                                        << " assembly element(s)");
    return document;
}

} // namespace testviz::xunit
