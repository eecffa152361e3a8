#pragma once
#include <quire/core/config.h>
#include <quire/core/diagnostics.h>
#include <quire/markup/parser.h>
#include <quire/net/fetcher.h>
#include <quire/platform/thread_pool.h>
#include <quire/xmldoc/document_holder.h>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <unordered_map>

namespace quire::xmldoc {

// Fetches, parses and caches documents by the URL they were requested
// under. Failed loads are not cached. The fetcher and parser must outlive
// the store and tolerate calls from the store's worker threads.
class DocumentStore {
public:
    DocumentStore(net::ResourceFetcher& fetcher, markup::MarkupParser& parser,
                  core::DiagnosticEmitter* diagnostics = nullptr,
                  size_t loader_threads = core::config::kDefaultLoaderThreads);
    ~DocumentStore();

    DocumentStore(const DocumentStore&) = delete;
    DocumentStore& operator=(const DocumentStore&) = delete;

    // Cached holder, or fetch + parse. nullptr when either step fails.
    std::shared_ptr<DocumentHolder> load(const std::string& url);

    // load() on a worker thread. Once `stop` is requested the load resolves
    // to nullptr and publishes nothing, unless the holder was already cached.
    std::future<std::shared_ptr<DocumentHolder>> load_async(const std::string& url,
                                                            std::stop_token stop = {});

    std::shared_ptr<DocumentHolder> get(const std::string& url) const;
    bool contains(const std::string& url) const;
    void evict(const std::string& url);
    void clear();
    size_t size() const;

private:
    std::shared_ptr<DocumentHolder> load_impl(const std::string& url, const std::stop_token& stop);
    void note(core::Severity severity, const std::string& stage, const std::string& message);
    platform::ThreadPool& pool();

    net::ResourceFetcher& fetcher_;
    markup::MarkupParser& parser_;
    core::DiagnosticEmitter* diagnostics_;
    size_t loader_threads_;

    mutable std::mutex cache_mutex_;
    std::unordered_map<std::string, std::shared_ptr<DocumentHolder>> cache_;

    std::mutex pool_mutex_;
    // Declared last: workers are joined before the cache goes away
    std::unique_ptr<platform::ThreadPool> pool_;
};

} // namespace quire::xmldoc
