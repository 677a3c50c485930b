#include "madokami.hpp"

#include "date_parser.hpp"
#include "errors.hpp"
#include "html_document.hpp"
#include "text_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <stdexcept>

using nlohmann::json;
using textutil::starts_with;

const char* const Madokami::kBaseUrl = "https://manga.madokami.al";

// -------------------- ctor --------------------
Madokami::Madokami(std::shared_ptr<HttpClient> http,
                   std::shared_ptr<const Settings> settings,
                   std::string baseUrl)
    : http_(std::move(http)),
      settings_(std::move(settings)),
      baseUrl_(std::move(baseUrl)) {
    if (!http_) throw std::runtime_error("Missing http client");
    while (!baseUrl_.empty() && baseUrl_.back() == '/') baseUrl_.pop_back();
    if (baseUrl_.find("://") == std::string::npos) throw std::runtime_error("Invalid base URL");
}

// -------------------- requests --------------------
Request Madokami::auth_get(const std::string& url) const {
    std::string username = settings_ ? settings_->get_string_or("username") : std::string();
    std::string password = settings_ ? settings_->get_string_or("password") : std::string();
    Request req = Request::get(url);
    if (!username.empty() || !password.empty()) {
        req.set_header("Authorization", textutil::basic_auth_header(username, password));
    }
    return req;
}

HtmlDocument Madokami::fetch_html(const std::string& url) const {
    Response r = http_->send(auth_get(url));
    return HtmlDocument(r.body);
}

// -------------------- row parsing --------------------
std::optional<Manga> Madokami::parse_manga_row(const HtmlElement& row) {
    auto link = row.select_first("td:nth-child(1) a:nth-child(1)");
    if (!link) return std::nullopt;
    auto href = link->attr("href");
    if (!href) return std::nullopt;

    auto info = textutil::derive_from_path(*href);
    if (info.title.empty()) return std::nullopt;

    Manga manga;
    manga.key = *href;
    manga.title = std::move(info.title);
    if (info.description && !info.description->empty()) manga.description = std::move(info.description);
    return manga;
}

std::vector<Manga> Madokami::parse_manga_rows(const HtmlDocument& html, const std::string& rowSelector) {
    std::vector<Manga> entries;
    for (const auto& row : html.select(rowSelector)) {
        if (auto manga = parse_manga_row(row)) entries.push_back(std::move(*manga));
    }
    return entries;
}

MangaStatus Madokami::parse_status(const std::string& text) {
    if (text == "Yes") return MangaStatus::Completed;
    if (text == "No") return MangaStatus::Ongoing;
    return MangaStatus::Unknown;
}

void Madokami::parse_details(const HtmlDocument& html, Manga& manga) {
    auto collect = [&html](const std::string& css) {
        std::vector<std::string> out;
        for (const auto& el : html.select(css)) {
            std::string t = el.text();
            if (!t.empty()) out.push_back(std::move(t));
        }
        return out;
    };

    manga.cover.reset();
    if (auto img = html.select_first("div.manga-info img[itemprop='image']")) {
        manga.cover = img->attr("src");
    }

    if (manga.title.empty()) {
        auto info = textutil::derive_from_path(manga.key);
        if (!info.title.empty()) manga.title = std::move(info.title);
        if (!manga.description) manga.description = std::move(info.description);
    }
    if (auto heading = html.select_text("div.manga-info-title h1")) {
        if (!heading->empty()) manga.title = std::move(*heading);
    }

    manga.authors = collect("a[itemprop='author']");
    manga.artists = collect("a[itemprop='artist']");

    if (auto synopsis = html.select_text("div.manga-info-synopsis")) {
        if (!synopsis->empty()) manga.description = std::move(*synopsis);
    }

    manga.status = parse_status(html.select_text("span.scanstatus").value_or(""));
    manga.tags = collect("div.genres a.tag");
}

std::optional<Chapter> Madokami::parse_chapter_row(const HtmlElement& row) {
    auto link = row.select_first("td:nth-child(6) a");
    if (!link) return std::nullopt;
    auto href = link->attr("href");
    if (!href) return std::nullopt;

    Chapter chapter;
    chapter.key = textutil::normalize_chapter_href(*href);
    if (auto a = row.select_first("td:nth-child(1) a")) chapter.title = a->text();

    std::string dateRaw;
    if (auto td = row.select_first("td:nth-child(3)")) dateRaw = td->text();
    chapter.date_uploaded = dateparse::parse_chapter_date(dateRaw);

    chapter.chapter_number = chapter.title ? textutil::parse_chapter_number(*chapter.title) : -1.0f;
    return chapter;
}

std::vector<Chapter> Madokami::parse_chapters(const HtmlDocument& html) {
    std::vector<Chapter> chapters;
    for (const auto& row : html.select("table#index-table > tbody > tr")) {
        if (auto chapter = parse_chapter_row(row)) chapters.push_back(std::move(*chapter));
    }
    // the index lists newest first
    std::reverse(chapters.begin(), chapters.end());
    return chapters;
}

std::vector<std::string> Madokami::parse_file_list(const std::string& filesJson) {
    std::vector<std::string> files;
    json j = json::parse(filesJson, nullptr, false);
    if (j.is_discarded() || !j.is_array()) return files;
    for (const auto& item : j) {
        if (!item.is_string()) return {};
        files.push_back(item.get<std::string>());
    }
    return files;
}

// -------------------- Source --------------------
MangaPageResult Madokami::get_search_manga_list(const std::optional<std::string>& query,
                                                int /*page*/,
                                                const std::vector<FilterValue>& filters) {
    std::string q = query.value_or("");
    if (q.empty()) {
        auto it = std::find_if(filters.begin(), filters.end(),
                               [](const FilterValue& f) { return f.id == "title"; });
        if (it != filters.end()) q = it->value;
    }

    const std::string url = baseUrl_ + "/search?q=" + textutil::encode_uri(q);
    HtmlDocument html = fetch_html(url);

    MangaPageResult result;
    result.entries = parse_manga_rows(html, "div.container table tbody tr");
    result.has_next_page = false;
    return result;
}

Manga Madokami::get_manga_update(Manga manga, bool needs_details, bool needs_chapters) {
    HtmlDocument html = fetch_html(baseUrl_ + manga.key);

    if (needs_details) parse_details(html, manga);
    if (needs_chapters) manga.chapters = parse_chapters(html);
    return manga;
}

std::vector<Page> Madokami::get_page_list(const Manga& /*manga*/, const Chapter& chapter) {
    HtmlDocument html = fetch_html(baseUrl_ + chapter.key);

    std::string dataPath;
    std::string filesJson;
    if (auto reader = html.select_first("div#reader")) {
        dataPath = reader->attr("data-path").value_or("");
        filesJson = reader->attr("data-files").value_or("");
    }
    if (dataPath.empty() || filesJson.empty()) return {};

    std::vector<Page> pages;
    const std::string pathParam = textutil::encode_component(dataPath);
    for (const auto& file : parse_file_list(filesJson)) {
        Page page;
        page.url = baseUrl_ + "/reader/image?path=" + pathParam + "&file=" + textutil::encode_component(file);
        pages.push_back(std::move(page));
    }
    return pages;
}

// -------------------- ListingProvider --------------------
std::vector<Listing> Madokami::listings() {
    return {Listing{"recent", "Recent"}};
}

MangaPageResult Madokami::get_manga_list(const Listing& listing, int page) {
    if (listing.id != "recent") {
        throw UnimplementedError("Unimplemented listing: " + listing.id);
    }

    HtmlDocument html = fetch_html(baseUrl_ + "/recent?page=" + std::to_string(page));

    MangaPageResult result;
    result.entries = parse_manga_rows(html, "table.mobile-files-table tbody tr");
    result.has_next_page = html.contains("a.pagination-next");
    return result;
}

// -------------------- Home & deep links --------------------
HomeLayout Madokami::get_home() {
    return HomeLayout{};
}

std::optional<DeepLinkResult> Madokami::handle_deep_link(const std::string& url) {
    if (!starts_with(url, baseUrl_)) return std::nullopt;

    DeepLinkResult result;
    result.key = url.substr(baseUrl_.size());
    if (starts_with(result.key, "reader/") || result.key.find("/reader/") != std::string::npos) {
        result.kind = DeepLinkResult::Kind::Chapter;
    } else {
        result.kind = DeepLinkResult::Kind::Manga;
    }
    return result;
}
