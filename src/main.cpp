#include "madokami.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

using nlohmann::json;

static json to_json(const Chapter& c) {
    json j = {{"key", c.key}};
    j["title"] = c.title ? json(*c.title) : json(nullptr);
    j["chapter_number"] = c.chapter_number ? json(*c.chapter_number) : json(nullptr);
    j["date_uploaded"] = c.date_uploaded ? json(*c.date_uploaded) : json(nullptr);
    return j;
}

static json to_json(const Manga& m) {
    json j = {
        {"key", m.key},
        {"title", m.title},
        {"authors", m.authors},
        {"artists", m.artists},
        {"status", to_string(m.status)},
        {"tags", m.tags}
    };
    j["description"] = m.description ? json(*m.description) : json(nullptr);
    j["cover"] = m.cover ? json(*m.cover) : json(nullptr);
    if (m.chapters) {
        json chapters = json::array();
        for (const auto& c : *m.chapters) chapters.push_back(to_json(c));
        j["chapters"] = chapters;
    }
    return j;
}

static json to_json(const MangaPageResult& r) {
    json entries = json::array();
    for (const auto& m : r.entries) entries.push_back(to_json(m));
    return {{"entries", entries}, {"has_next_page", r.has_next_page}};
}

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> [arg] [settings.json]\n"
              << "Commands:\n"
              << "  search <query>        search series by name\n"
              << "  manga <key>           series details\n"
              << "  chapters <key>        chapter list, oldest first\n"
              << "  pages <chapter-key>   image urls of a chapter\n"
              << "  listings              supported listings\n"
              << "  recent [page]         recently added files\n"
              << "  home                  home layout\n"
              << "  link <url>            resolve a site url\n"
              << "Settings (username/password) are read from the json file or $MADOKAMI_SETTINGS.\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage(argv[0]);
        return 2;
    }
    std::string command = argv[1];
    std::string arg = argc > 2 ? argv[2] : "";
    std::string settingsPath;
    if (argc > 3) settingsPath = argv[3];
    else if (const char* env = std::getenv("MADOKAMI_SETTINGS")) settingsPath = env;

    bool verbose = std::getenv("MADOKAMI_VERBOSE") != nullptr;

    try {
        std::shared_ptr<const Settings> settings;
        if (!settingsPath.empty()) settings = std::make_shared<JsonSettings>(settingsPath);
        else settings = std::make_shared<MemorySettings>();

        auto http = std::make_shared<CprHttpClient>(CprHttpClient::kDefaultUserAgent, 30000, verbose);
        Madokami source(http, settings);

        json out;
        if (command == "search") {
            out = to_json(source.get_search_manga_list(arg, 1, {}));
        } else if (command == "manga" || command == "chapters") {
            Manga manga;
            manga.key = arg;
            bool chapters = command == "chapters";
            out = to_json(source.get_manga_update(manga, !chapters, chapters));
        } else if (command == "pages") {
            Chapter chapter;
            chapter.key = arg;
            out = json::array();
            for (const auto& p : source.get_page_list(Manga{}, chapter)) out.push_back(p.url);
        } else if (command == "listings") {
            out = json::array();
            for (const auto& l : Madokami::listings()) out.push_back({{"id", l.id}, {"name", l.name}});
        } else if (command == "recent") {
            int page = arg.empty() ? 1 : std::max(1, atoi(arg.c_str()));
            out = to_json(source.get_manga_list(Listing{"recent", "Recent"}, page));
        } else if (command == "home") {
            out = {{"components", json::array()}};
            for (const auto& c : source.get_home().components) {
                json entries = json::array();
                for (const auto& m : c.entries) entries.push_back(to_json(m));
                out["components"].push_back({{"title", c.title}, {"entries", entries}});
            }
        } else if (command == "link") {
            auto result = source.handle_deep_link(arg);
            if (!result) {
                out = nullptr;
            } else {
                bool chapter = result->kind == DeepLinkResult::Kind::Chapter;
                out = {{"kind", chapter ? "chapter" : "manga"}, {"key", result->key}};
                if (chapter) out["manga_key"] = result->manga_key;
            }
        } else {
            usage(argv[0]);
            return 2;
        }
        std::cout << out.dump(2) << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
