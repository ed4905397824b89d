#ifndef INICONFIG_HPP
#define INICONFIG_HPP

#include <map>
#include <string>
#include <vector>

class IniConfig {
public:
    bool load(const std::string& filename);
    bool save(const std::string& filename) const;

    std::string getValue(const std::string& section, const std::string& key,
                         const std::string& default_value = "") const;
    void setValue(const std::string& section, const std::string& key, const std::string& value);
    bool hasValue(const std::string& section, const std::string& key) const;

    bool getBool(const std::string& section, const std::string& key, bool default_value) const;
    void setBool(const std::string& section, const std::string& key, bool value);

    // Falls back to default_value when the stored value is not an integer
    int getInt(const std::string& section, const std::string& key, int default_value) const;
    void setInt(const std::string& section, const std::string& key, int value);

    // Comma separated, entries trimmed, empty entries dropped
    std::vector<std::string> getList(const std::string& section, const std::string& key) const;
    void setList(const std::string& section, const std::string& key,
                 const std::vector<std::string>& values);

    void removeSection(const std::string& section);
    void clear();

private:
    std::map<std::string, std::map<std::string, std::string>> data;
};

#endif
