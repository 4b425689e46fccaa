#include <catch2/catch_test_macros.hpp>

#include "docs/doc_retriever.hpp"
#include "docs/online_source.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace {

class FakeSource : public DocSource {
public:
    FakeSource(std::string name, std::map<std::string, std::string> pages, int* calls = nullptr)
        : name_(std::move(name)), pages_(std::move(pages)), calls_(calls) {}

    std::string_view name() const override { return name_; }
    std::string title_for(const std::string& command) const override { return name_ + " for " + command; }
    std::expected<std::string, std::string> fetch(const std::string& command) override {
        if (calls_) ++*calls_;
        auto it = pages_.find(command);
        if (it == pages_.end()) return std::unexpected(name_ + ": nothing");
        return it->second;
    }

private:
    std::string name_;
    std::map<std::string, std::string> pages_;
    int* calls_;
};

DocRetriever make_retriever(int* second_calls = nullptr) {
    std::vector<std::unique_ptr<DocSource>> sources;
    sources.push_back(std::make_unique<FakeSource>(
        "man", std::map<std::string, std::string>{{"ls", "LS(1) list directory contents"}}));
    sources.push_back(std::make_unique<FakeSource>(
        "help", std::map<std::string, std::string>{{"ls", "Usage: ls"}, {"rg", "Usage: rg PATTERN"}},
        second_calls));
    return DocRetriever(std::move(sources));
}

} // namespace

TEST_CASE("DocRetriever", "[docs]") {

    SECTION("FirstSourceWins") {
        int help_calls = 0;
        auto retriever = make_retriever(&help_calls);
        auto doc = retriever.lookup("ls");
        REQUIRE(doc);
        REQUIRE(doc->source == "man");
        REQUIRE(doc->title == "man for ls");
        REQUIRE(doc->content == "LS(1) list directory contents");
        REQUIRE(help_calls == 0);
    }

    SECTION("FallsThroughToNextSource") {
        auto retriever = make_retriever();
        auto doc = retriever.lookup("rg");
        REQUIRE(doc);
        REQUIRE(doc->source == "help");
        REQUIRE(doc->formatted() == "--- help for rg ---\n\nUsage: rg PATTERN");
    }

    SECTION("NothingFound") {
        auto retriever = make_retriever();
        auto doc = retriever.lookup("nosuchtool");
        REQUIRE_FALSE(doc);
        REQUIRE(doc.error() == "No documentation found for nosuchtool");
        REQUIRE(retriever.get_documentation("nosuchtool") == "No documentation found for nosuchtool");
    }

    SECTION("InvalidCommandNeverReachesSources") {
        int help_calls = 0;
        auto retriever = make_retriever(&help_calls);
        auto doc = retriever.lookup("--version");
        REQUIRE_FALSE(doc);
        REQUIRE(doc.error() == "Invalid command: --version");
        REQUIRE(help_calls == 0);
    }

    SECTION("GetDocumentationFormats") {
        auto retriever = make_retriever();
        REQUIRE(retriever.get_documentation("ls") == "--- man for ls ---\n\nLS(1) list directory contents");
    }

    SECTION("MakeSourcesFollowsConfigOrder") {
        Config::Docs cfg;
        cfg.sources = {"help", "bogus", "man"};
        DocRetriever retriever(DocRetriever::make_sources(cfg));
        REQUIRE(retriever.source_names() == std::vector<std::string>{"help", "man"});
    }

    SECTION("DefaultSources") {
        DocRetriever retriever(DocRetriever::make_sources(Config::Docs{}));
        REQUIRE(retriever.source_names() == std::vector<std::string>{"man", "help"});
    }

    SECTION("OnlineIsOptIn") {
        Config::Docs cfg;
        cfg.sources = {"man", "help", "online"};
        DocRetriever retriever(DocRetriever::make_sources(cfg));
        REQUIRE(retriever.source_names() == std::vector<std::string>{"man", "help", "online"});
    }
}

TEST_CASE("Documentation helpers", "[docs]") {

    SECTION("FormatDocumentation") {
        REQUIRE(docs::format_documentation("Man page for ls", "body") == "--- Man page for ls ---\n\nbody");
    }

    SECTION("ValidCommand") {
        REQUIRE(docs::valid_command("ls"));
        REQUIRE(docs::valid_command("g++"));
        REQUIRE(docs::valid_command("systemd-analyze"));
        REQUIRE_FALSE(docs::valid_command(""));
        REQUIRE_FALSE(docs::valid_command("-rf"));
        REQUIRE_FALSE(docs::valid_command("ls -la"));
        REQUIRE_FALSE(docs::valid_command("ls;\nrm"));
        REQUIRE_FALSE(docs::valid_command("a\tb"));
    }

    SECTION("CleanAppName") {
        REQUIRE(docs::clean_app_name("vim") == "vim");
        REQUIRE(docs::clean_app_name("/usr/bin/vim notes.txt") == "vim");
        REQUIRE(docs::clean_app_name("code.desktop") == "code");
        REQUIRE(docs::clean_app_name("  htop  ") == "htop");
        REQUIRE(docs::clean_app_name("").empty());
    }

    SECTION("IgnoredTerms") {
        std::vector<std::string> terms = {"wingman", "python", "main.py"};
        REQUIRE(docs::is_ignored("python3", terms));
        REQUIRE(docs::is_ignored("Wingman", terms));
        REQUIRE(docs::is_ignored("/usr/bin/python3 main.py", terms));
        REQUIRE_FALSE(docs::is_ignored("kitty", terms));
        REQUIRE_FALSE(docs::is_ignored("kitty", std::vector<std::string>{""}));
    }
}

TEST_CASE("OnlineSource URLs", "[docs]") {
    OnlineSource source(std::map<std::string, std::string>{
        {"default", "https://www.google.com/search?q={query}"},
        {"git", "https://git-scm.com/docs/{query}"},
    });

    SECTION("DefaultPattern") {
        REQUIRE(source.url_for("ls") == "https://www.google.com/search?q=ls");
    }

    SECTION("CommandSpecificPattern") {
        REQUIRE(source.url_for("git") == "https://git-scm.com/docs/git");
    }

    SECTION("QueryIsEscaped") {
        REQUIRE(source.url_for("c++") == "https://www.google.com/search?q=c%2B%2B");
    }

    SECTION("NoPattern") {
        OnlineSource empty(std::map<std::string, std::string>{});
        REQUIRE(empty.url_for("ls").empty());
        REQUIRE_FALSE(empty.fetch("ls"));
    }
}
