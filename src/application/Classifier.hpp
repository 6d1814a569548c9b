/**
 * @file Classifier.hpp
 * @brief Maps a drop-zone file to its destination category.
 */

#pragma once
#include <optional>
#include <string>
#include "domain/Configuration.hpp"

namespace dropkeeper::application {

/**
 * @class Classifier
 * @brief Stateless keyword and extension lookup with optional magic-byte sniffing.
 *
 * Order: keyword rules on the file name, extension table, content signature,
 * fallback. Same input always yields the same category.
 */
class Classifier {
public:
    /**
     * @param table Routing table; must outlive the classifier.
     * @param sniffContent When true, unmapped extensions are resolved from the file header.
     */
    explicit Classifier(const domain::RoutingTable& table, bool sniffContent = true);

    /** @brief Category for @p path. Never empty. */
    std::string classify(const std::string& path) const;

    /** @brief Folder the category is routed to. */
    std::string destinationFor(const std::string& category) const;

    /**
     * @brief Canonical extension for a known file signature (".pdf", ".zip"...).
     * @return nullopt when the header does not match any known signature.
     */
    static std::optional<std::string> SniffExtension(const std::string& header);

private:
    const domain::RoutingTable& m_table;
    bool m_sniffContent;

    std::optional<std::string> lookup(const std::string& extension) const;
    std::optional<std::string> matchKeywords(const std::string& filename) const;
};

} // namespace dropkeeper::application
