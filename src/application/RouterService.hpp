/**
 * @file RouterService.hpp
 * @brief Application service that empties the drop zone into the folder taxonomy.
 */

#pragma once
#include <functional>
#include <memory>
#include <string>
#include <system_error>

#include "application/Classifier.hpp"
#include "domain/Configuration.hpp"
#include "domain/FileRecord.hpp"
#include "infrastructure/DropZoneScanner.hpp"

namespace dropkeeper::application {

class Deduplicator;

/**
 * @class RouterService
 * @brief Classifies, deduplicates and moves every file found in the drop zone.
 *
 * Each scanned file yields exactly one RoutingOutcome. Per-file errors are
 * recorded in the report; run() itself only throws if the drop zone cannot be
 * listed at all.
 */
class RouterService {
public:
    /**
     * @param config Deployment configuration; must outlive the service.
     * @param scanner Source of drop-zone entries.
     */
    RouterService(const domain::Configuration& config, std::unique_ptr<infrastructure::DropZoneScanner> scanner);

    /**
     * @brief Routes the current content of the drop zone.
     * @param statusCallback Optional callback receiving one line per file.
     */
    domain::RoutingReport run(std::function<void(std::string)> statusCallback = nullptr);

    /**
     * @brief Picks a free name in @p folder for @p filename.
     *
     * Tries the original name, then <stem>_<first 8 hex of fingerprint><ext>,
     * then appends _1, _2... to the latter.
     */
    static std::string ResolveCollision(const std::string& folder, const std::string& filename,
                                        const std::string& fingerprint);

    /** @brief Maps a filesystem error to the reason code of a Failed outcome. */
    static domain::FailureReason ReasonFor(const std::error_code& ec);

private:
    const domain::Configuration& m_config;
    std::unique_ptr<infrastructure::DropZoneScanner> m_scanner;
    Classifier m_classifier;

    domain::RoutingOutcome routeOne(const infrastructure::DropZoneEntry& entry, Deduplicator& dedup);
};

} // namespace dropkeeper::application
