#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "http_client.hpp"
#include "models.hpp"
#include "settings.hpp"
#include "source.hpp"

class HtmlDocument;
class HtmlElement;

// Source for manga.madokami.al, a file-index style site behind HTTP basic auth.
class Madokami : public Source,
                 public ListingProvider,
                 public Home,
                 public DeepLinkHandler {
public:
    static const char* const kBaseUrl;

    Madokami(std::shared_ptr<HttpClient> http,
             std::shared_ptr<const Settings> settings,
             std::string baseUrl = kBaseUrl);

    MangaPageResult get_search_manga_list(const std::optional<std::string>& query,
                                          int page,
                                          const std::vector<FilterValue>& filters) override;
    Manga get_manga_update(Manga manga, bool needs_details, bool needs_chapters) override;
    std::vector<Page> get_page_list(const Manga& manga, const Chapter& chapter) override;

    MangaPageResult get_manga_list(const Listing& listing, int page) override;

    HomeLayout get_home() override;

    std::optional<DeepLinkResult> handle_deep_link(const std::string& url) override;

    // Listings get_manga_list understands.
    static std::vector<Listing> listings();

    // GET request for url, with basic auth when credentials are configured.
    Request auth_get(const std::string& url) const;

    const std::string& base_url() const { return baseUrl_; }

    // "Yes" -> Completed, "No" -> Ongoing, anything else Unknown.
    static MangaStatus parse_status(const std::string& text);

private:
    HtmlDocument fetch_html(const std::string& url) const;

    static std::vector<Manga> parse_manga_rows(const HtmlDocument& html, const std::string& rowSelector);
    static std::optional<Manga> parse_manga_row(const HtmlElement& row);
    static void parse_details(const HtmlDocument& html, Manga& manga);
    static std::vector<Chapter> parse_chapters(const HtmlDocument& html);
    static std::optional<Chapter> parse_chapter_row(const HtmlElement& row);
    static std::vector<std::string> parse_file_list(const std::string& filesJson);

    std::shared_ptr<HttpClient> http_;
    std::shared_ptr<const Settings> settings_;
    std::string baseUrl_;
};
