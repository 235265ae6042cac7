// Copyright (c) 2026 UltiMaker
// FlowScale is released under the terms of the AGPLv3 or higher

#ifndef SETTINGS_SETTINGS_H
#define SETTINGS_SETTINGS_H

#include <string>
#include <unordered_map>

namespace flowscale
{

/*!
 * \brief Container for a set of settings.
 *
 * You can ask this container for the value of a certain setting. Values are
 * stored in serialised form, the way they were given on the command line or
 * in the environment, and are only interpreted when they are requested.
 *
 * Before the settings can be returned, the settings have to be added first
 * using the add() function.
 */
class Settings
{
public:
    /*
     * \brief Properly initialises the Settings instance.
     */
    Settings();

    /*!
     * \brief Adds a new setting, or replaces the value of an existing one.
     * \param key The name by which the setting is identified.
     * \param value The value of the setting, in serialised form.
     */
    void add(const std::string& key, const std::string value);

    /*!
     * \brief Get the value of a setting.
     *
     * This value is then evaluated using the following technique:
     *  1. If this container contains a value for the setting, it uses that
     *     value directly.
     *  2. Otherwise it asks its parent settings container for the setting value
     *     and returns that. The parent then goes through the same process.
     *  3. If a setting is not known at all, or its value can't be interpreted
     *     as the requested type, a ConfigurationError is thrown.
     * \param key The key of the setting to get.
     * \return The setting's value, cast to the desired type.
     */
    template<typename A>
    A get(const std::string& key) const;

    /*!
     * \brief Indicate whether a value for the setting can be found, either in
     * this container or in one of its ancestors.
     * \param key The setting to check.
     */
    bool has(const std::string& key) const;

    /*!
     * \brief Get a string containing all settings in this container, for
     * logging. Settings of the parents are not included.
     */
    const std::string getAllSettingsString() const;

    /*
     * Change the parent settings object.
     *
     * If this set of settings has no value for a setting, the parent is asked.
     */
    void setParent(const Settings* new_parent);

private:
    /*!
     * Optionally, a parent setting container to ask for the value of a setting
     * if this container has no value for it.
     */
    const Settings* parent;

    /*!
     * \brief A dictionary to map the setting keys to the actual setting values.
     */
    std::unordered_map<std::string, std::string> settings;
};

} // namespace flowscale

#endif // SETTINGS_SETTINGS_H
