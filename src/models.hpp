#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class MangaStatus {
    Unknown,
    Ongoing,
    Completed
};

struct Chapter {
    std::string key;                       // site-relative reader path
    std::optional<std::string> title;
    std::optional<float> chapter_number;   // -1 when unparsable
    std::optional<std::int64_t> date_uploaded; // 0 when unparsable
};

struct Manga {
    std::string key;                       // site-relative series path
    std::string title;
    std::optional<std::string> description;
    std::optional<std::string> cover;
    std::vector<std::string> authors;
    std::vector<std::string> artists;
    MangaStatus status = MangaStatus::Unknown;
    std::vector<std::string> tags;
    std::optional<std::vector<Chapter>> chapters;
};

struct Page {
    std::string url;
};

struct MangaPageResult {
    std::vector<Manga> entries;
    bool has_next_page = false;
};

struct Listing {
    std::string id;
    std::string name;
};

struct FilterValue {
    std::string id;
    std::string value;
};

struct HomeComponent {
    std::string title;
    std::vector<Manga> entries;
};

struct HomeLayout {
    std::vector<HomeComponent> components;
};

struct DeepLinkResult {
    enum class Kind { Manga, Chapter };

    Kind kind = Kind::Manga;
    std::string manga_key;   // empty when only the chapter is known
    std::string key;
};

inline const char* to_string(MangaStatus status) {
    switch (status) {
    case MangaStatus::Ongoing: return "ongoing";
    case MangaStatus::Completed: return "completed";
    default: return "unknown";
    }
}
