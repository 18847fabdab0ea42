#pragma once

/**
 * @file config_reader.hpp
 * @brief Reader for the YAML-like model configuration and key: value records
 *
 * ```
 * structure:
 *   rho: 998.2
 *   g: 9.81
 *   Lref: 2.0
 *   motion_method: "Broyden"
 *   cushion_force_method: "Integrated"
 *
 * bodies:
 *   - name: "hull"
 *     free_in_draft: true
 *     free_in_trim: true
 *     xCofG: 0.8
 *
 * substructures:
 *   - name: "flap"
 *     type: "torsionalSpring"
 *     body: "hull"
 *     spring_constant: 1.0e3     # N m / deg
 *     attachedSubstructure: "skin"
 * ```
 *
 * Nesting follows indentation. "- " starts a list item whose keys are
 * indented past the dash. Text after " #" is a comment. The result files
 * written per iteration use the same key: value form.
 */

#include <planingsim/core/core.hpp>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace pls {
namespace io {

using ConfigValue = std::variant<
    std::string,
    Real,
    Int,
    bool,
    std::vector<Real>,
    std::vector<Int>,
    std::vector<std::string>
>;

// ============================================================================
// Section
// ============================================================================

/**
 * @brief Keys, named subsections and list items of one configuration level
 *
 * Getters return the default for a missing key and throw
 * InvalidArgumentError when the stored value has the wrong type.
 */
class ConfigSection {
public:
    ConfigSection() = default;
    explicit ConfigSection(std::string name) : name_(std::move(name)) {}

    const std::string& name() const { return name_; }

    bool has(const std::string& key) const { return values_.count(key) > 0; }

    std::string get_string(const std::string& key, const std::string& default_val = "") const;
    Real get_real(const std::string& key, Real default_val = 0.0) const;
    Int get_int(const std::string& key, Int default_val = 0) const;
    bool get_bool(const std::string& key, bool default_val = false) const;

    std::vector<Real> get_real_array(const std::string& key) const;
    std::vector<Int> get_int_array(const std::string& key) const;
    std::vector<std::string> get_string_array(const std::string& key) const;

    void set(const std::string& key, ConfigValue value) { values_[key] = std::move(value); }

    /// Get or create
    ConfigSection& subsection(const std::string& name);

    /// @throws InvalidArgumentError if absent
    const ConfigSection& subsection(const std::string& name) const;

    bool has_subsection(const std::string& name) const { return subsections_.count(name) > 0; }

    /// List items in file order
    std::vector<const ConfigSection*> list_items() const;
    ConfigSection& append_item();

private:
    const ConfigValue* find(const std::string& key) const;
    [[noreturn]] void type_mismatch(const std::string& key, const char* expected) const;

    std::string name_;
    std::map<std::string, ConfigValue> values_;
    std::map<std::string, std::shared_ptr<ConfigSection>> subsections_;
    std::vector<std::shared_ptr<ConfigSection>> items_;
};

// ============================================================================
// Reader
// ============================================================================

class ConfigReader {
public:
    ConfigReader() = default;

    /// @throws FileIOError if the file cannot be opened
    ConfigSection read(const std::string& filename) const;

    /// @throws InvalidArgumentError on a malformed line
    ConfigSection read_string(const std::string& content, const std::string& source = "<string>") const;

    /// Scalar or inline-array value as written after "key:"
    static ConfigValue parse_value(const std::string& text);
};

} // namespace io
} // namespace pls
