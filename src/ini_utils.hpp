#pragma once

#include <string>
#include <vector>

// Small helpers shared by the INI-ish readers (settings, terrain overrides).

std::string trim(std::string s);
std::string toLower(std::string s);
void stripUtf8Bom(std::string& s);

// Removes a trailing '#' or ';' comment. Quoted strings are not special.
std::string stripIniComment(const std::string& line);

// Splits "key = value" (key lowercased, both trimmed). Returns false if there is no '='.
bool splitIniLine(const std::string& line, std::string& key, std::string& value);

std::vector<std::string> splitDot(const std::string& s);
std::vector<std::string> splitList(const std::string& s, char sep);

// Whole-string parsers (trailing whitespace allowed). They never throw.
bool parseInt(const std::string& raw, int& out);
bool parseUint32(const std::string& raw, unsigned int& out);
bool parseFloat(const std::string& raw, float& out);
bool parseDouble(const std::string& raw, double& out);
bool parseBool(const std::string& raw, bool& out);

// Appends "Line N: msg" to `w`, capping the number of lines kept.
void appendWarning(std::string& w, int lineNo, const std::string& msg, int& warnCount, int warnLimit = 30);
