#pragma once

#include <optional>
#include <string>
#include <vector>

#include "models.hpp"

// Entry points a host calls on a loaded source. A concrete source picks the
// capabilities it supports by deriving from the matching interfaces.

class Source {
public:
    virtual ~Source() = default;

    virtual MangaPageResult get_search_manga_list(const std::optional<std::string>& query,
                                                  int page,
                                                  const std::vector<FilterValue>& filters) = 0;

    // Fills details and/or the chapter list of `manga` from one fetch of its page.
    virtual Manga get_manga_update(Manga manga, bool needs_details, bool needs_chapters) = 0;

    virtual std::vector<Page> get_page_list(const Manga& manga, const Chapter& chapter) = 0;
};

class ListingProvider {
public:
    virtual ~ListingProvider() = default;

    virtual MangaPageResult get_manga_list(const Listing& listing, int page) = 0;
};

class Home {
public:
    virtual ~Home() = default;

    virtual HomeLayout get_home() = 0;
};

class DeepLinkHandler {
public:
    virtual ~DeepLinkHandler() = default;

    // nullopt when the url does not belong to this source.
    virtual std::optional<DeepLinkResult> handle_deep_link(const std::string& url) = 0;
};
