#include <quire/xmldoc/document_store.h>
#include <quire/xmldoc/content_resolver.h>

namespace quire::xmldoc {

namespace {

constexpr const char kModule[] = "store";

} // namespace

DocumentStore::DocumentStore(net::ResourceFetcher& fetcher, markup::MarkupParser& parser,
                             core::DiagnosticEmitter* diagnostics, size_t loader_threads)
    : fetcher_(fetcher)
    , parser_(parser)
    , diagnostics_(diagnostics)
    , loader_threads_(loader_threads) {}

DocumentStore::~DocumentStore() {
    std::lock_guard lock(pool_mutex_);
    if (pool_) {
        pool_->shutdown();
    }
}

std::shared_ptr<DocumentHolder> DocumentStore::load(const std::string& url) {
    return load_impl(url, std::stop_token{});
}

std::future<std::shared_ptr<DocumentHolder>> DocumentStore::load_async(const std::string& url,
                                                                       std::stop_token stop) {
    return pool().submit([this, url, stop = std::move(stop)]() {
        return load_impl(url, stop);
    });
}

std::shared_ptr<DocumentHolder> DocumentStore::load_impl(const std::string& url,
                                                         const std::stop_token& stop) {
    if (auto cached = get(url)) {
        return cached;
    }
    if (stop.stop_requested()) {
        note(core::Severity::Info, "cancel", "load of " + url + " canceled before fetch");
        return nullptr;
    }

    auto response = fetcher_.fetch(url);
    if (!response) {
        note(core::Severity::Warning, "fetch", "unable to fetch " + url);
        return nullptr;
    }
    if (response->url.empty()) {
        response->url = url;
    }
    if (stop.stop_requested()) {
        note(core::Severity::Info, "cancel", "load of " + url + " canceled after fetch");
        return nullptr;
    }

    auto holder = parse_xml_resource(*response, parser_, diagnostics_);
    if (!holder) {
        note(core::Severity::Warning, "load", "unable to parse " + url);
        return nullptr;
    }

    std::lock_guard lock(cache_mutex_);
    // A concurrent load may have published first; keep its holder so
    // every caller sees the same one
    auto existing = cache_.find(url);
    if (existing != cache_.end()) {
        return existing->second;
    }
    if (stop.stop_requested()) {
        note(core::Severity::Info, "cancel", "load of " + url + " canceled after parse");
        return nullptr;
    }
    cache_.emplace(url, holder);
    note(core::Severity::Info, "load", "loaded " + url);
    return holder;
}

std::shared_ptr<DocumentHolder> DocumentStore::get(const std::string& url) const {
    std::lock_guard lock(cache_mutex_);
    auto it = cache_.find(url);
    return it != cache_.end() ? it->second : nullptr;
}

bool DocumentStore::contains(const std::string& url) const {
    std::lock_guard lock(cache_mutex_);
    return cache_.count(url) > 0;
}

void DocumentStore::evict(const std::string& url) {
    std::lock_guard lock(cache_mutex_);
    cache_.erase(url);
}

void DocumentStore::clear() {
    std::lock_guard lock(cache_mutex_);
    cache_.clear();
}

size_t DocumentStore::size() const {
    std::lock_guard lock(cache_mutex_);
    return cache_.size();
}

void DocumentStore::note(core::Severity severity, const std::string& stage,
                         const std::string& message) {
    if (diagnostics_) {
        diagnostics_->emit(severity, kModule, stage, message);
    }
}

platform::ThreadPool& DocumentStore::pool() {
    std::lock_guard lock(pool_mutex_);
    if (!pool_) {
        pool_ = std::make_unique<platform::ThreadPool>(loader_threads_);
    }
    return *pool_;
}

} // namespace quire::xmldoc
