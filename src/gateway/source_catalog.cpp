#include "source_catalog.h"
#include "adapters/sources/codeforces.h"
#include "adapters/sources/devto.h"
#include "adapters/sources/gfg.h"
#include "adapters/sources/github.h"
#include "adapters/sources/gitlab.h"
#include "adapters/sources/hackernews.h"
#include "adapters/sources/kaggle.h"
#include "adapters/sources/npm.h"
#include "adapters/sources/pypi.h"
#include "adapters/sources/reddit.h"
#include "adapters/sources/stackoverflow.h"
#include "core/log_manager.h"
#include <memory>
#include <vector>

namespace source_catalog {

int registerDefaultSources(RouterRegistry& registry,
                           IUpstreamClient& client,
                           const GatewayConfig& config)
{
    std::vector<std::unique_ptr<ISourceAdapter>> sources;
    sources.push_back(std::make_unique<GitHubSource>(client, config.credentials));
    sources.push_back(std::make_unique<GitLabSource>(client, config.credentials));
    sources.push_back(std::make_unique<StackOverflowSource>(client, config.defaults));
    sources.push_back(std::make_unique<HackerNewsSource>(client));
    sources.push_back(std::make_unique<DevToSource>(client, config.credentials));
    sources.push_back(std::make_unique<KaggleSource>(client, config.credentials));
    sources.push_back(std::make_unique<CodeforcesSource>(client, config.defaults));
    sources.push_back(std::make_unique<GeeksForGeeksSource>(client));
    sources.push_back(std::make_unique<PyPISource>(client));
    sources.push_back(std::make_unique<NpmSource>(client));
    sources.push_back(std::make_unique<RedditSource>(client));

    int mounted = 0;
    for (auto& source : sources) {
        if (registry.registerAdapter(std::move(source)))
            ++mounted;
    }

    LOG_INFO(QStringLiteral("SourceCatalog: %1 source(s), %2 route(s) mounted")
                 .arg(mounted)
                 .arg(registry.routeCount()));
    return mounted;
}

}
