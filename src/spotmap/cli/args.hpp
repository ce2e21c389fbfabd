#pragma once
#include <iostream>
#include <stdexcept>
#include <string>

/*
  Simple CLI argument helpers.

  Conventions:
    - Key format: --key=value  (no spaces)
    - Parsing starts at argv[2] because argv[1] is the mode.
      Example:   spotmap-cli render --points=pts.csv --image=scan.png
    - Keys are case-sensitive.

  Notes:
    - A missing key returns the default value.
    - A value that is not a number is reported on stderr and the default is used.
    - This parser does not handle quotes, repeated keys, or short flags (-k).
*/

/* Get string value for "--key=value". Returns 'def' if not found. */
inline std::string argValue(int argc, char** argv, const std::string& key, const std::string& def = {}) {
    const std::string pref = "--" + key + "=";
    for (int i = 2; i < argc; ++i) {
        std::string a(argv[i]);
        if (a.rfind(pref, 0) == 0) return a.substr(pref.size());
    }
    return def;
}

/* Get int value for "--key=value". Returns 'def' on missing or parse error. */
inline int argValueInt(int argc, char** argv, const std::string& key, int def) {
    std::string v = argValue(argc, argv, key, "");
    if (v.empty()) return def;
    try {
        std::size_t used = 0;
        int r = std::stoi(v, &used);
        if (used == v.size()) return r;
    } catch (const std::logic_error&) {
    }
    std::cerr << "[args] --" << key << "=" << v << " is not an integer, using " << def << "\n";
    return def;
}

/* Get double value for "--key=value". Returns 'def' on missing or parse error. */
inline double argValueDouble(int argc, char** argv, const std::string& key, double def) {
    std::string v = argValue(argc, argv, key, "");
    if (v.empty()) return def;
    try {
        std::size_t used = 0;
        double r = std::stod(v, &used);
        if (used == v.size()) return r;
    } catch (const std::logic_error&) {
    }
    std::cerr << "[args] --" << key << "=" << v << " is not a number, using " << def << "\n";
    return def;
}
