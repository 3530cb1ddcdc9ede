#ifndef V2M_CONFIG_READER_HPP
#define V2M_CONFIG_READER_HPP

#include "V2M.hpp"
#include <string>
#include <map>
#include <vector>
#include <array>
#include <fstream>
#include <sstream>

namespace V2M {

/**
 * @brief INI-style configuration reader
 *
 * Configures the template mesh and the mesh decoder from a single text file.
 * Lists are comma separated; lists of lists separate their groups with ';',
 * e.g. "aggregate_indices = 3,4; 2,3; 1,2".
 */
class ConfigReader {
public:
    ConfigReader();

    /**
     * @brief Load configuration from file
     * @return false if the file cannot be opened
     */
    bool loadFile(const std::string& filename);

    /**
     * @brief Load configuration from a string (same syntax as a file)
     */
    bool loadString(const std::string& content);

    // =========================================================================
    // Structured configuration
    // =========================================================================

    /**
     * @brief Fill a decoder configuration from the [decoder] section
     *
     * Keys that are absent keep the defaults of GraphDecoderConfig.
     *
     * @return false if the section does not exist
     * @throws ConfigurationError for malformed values
     */
    bool parseDecoderConfig(GraphDecoderConfig& config) const;

    /**
     * @brief Fill a template configuration from the [template] section
     */
    bool parseTemplateConfig(TemplateConfig& config) const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key,
               int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                     double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                 bool default_val = false) const;
    std::vector<double> getDoubleArray(const std::string& section,
                                       const std::string& key) const;
    std::vector<int> getIntArray(const std::string& section,
                                 const std::string& key) const;
    std::vector<std::vector<int>> getIntArrayList(const std::string& section,
                                                  const std::string& key) const;
    std::vector<std::vector<double>> getDoubleArrayList(const std::string& section,
                                                        const std::string& key) const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    // =========================================================================
    // Template Generation
    // =========================================================================

    static void generateTemplate(const std::string& filename);

private:
    std::map<std::string, std::map<std::string, std::string>> data;

    bool parseStream(std::istream& in);

    std::string trim(const std::string& str) const;
    std::vector<std::string> split(const std::string& str, char delim) const;

    int parseInt(const std::string& token, const std::string& key) const;
    double parseDouble(const std::string& token, const std::string& key) const;
};

} // namespace V2M

#endif // V2M_CONFIG_READER_HPP
