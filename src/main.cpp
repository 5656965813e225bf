#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "BeastTransport.hpp"
#include "CacheMiddleware.hpp"
#include "IndexedCacheManager.hpp"
#include "Logger.hpp"
#include "MemoryCacheManager.hpp"

// httpcache_fetch <url> [mode] [store directory]
//
// Fetches url once through the cache and prints the response. With a store
// directory the cache is kept on disk, so a second run can be served from it.
int main(int argc, char * argv[]) {
    if (argc < 2 || argc > 4) {
        std::cerr << "usage: " << argv[0] << " <url> [mode] [store directory]" << std::endl;
        return EXIT_FAILURE;
    }

    try {
        Logger & logger = Logger::getInstance();
        logger.setLogPath("logs/httpcache.");
        logger.setConsole(false);
        logger.setLevel(Logger::INFO);
        logger.info("starting httpcache_fetch...");

        CacheMode mode = argc > 2 ? modeFromString(argv[2]) : CacheMode::DEFAULT;

        std::shared_ptr<CacheManager> manager;
        if (argc > 3) {
            IndexedStoreOptions storeOptions;
            storeOptions.path = argv[3];
            storeOptions.storageType = StorageType::DISC_COPIES;
            manager = std::make_shared<IndexedCacheManager>(storeOptions);
        } else {
            manager = std::make_shared<MemoryCacheManager>();
        }

        CacheMiddleware client(std::make_shared<HttpCache>(mode, manager),
                               std::make_shared<BeastTransport>());

        Request request(http::verb::get, std::string(argv[1]));
        Response response = client.fetch(request);

        std::cout << response.toBeast() << std::endl;
        return EXIT_SUCCESS;
    } catch (const std::exception & e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
