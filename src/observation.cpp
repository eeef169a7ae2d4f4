#include "observation.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <istream>
#include <iterator>
#include <sstream>
#include <string>
#include <unordered_set>

#include "errors.h"

namespace fmcal {

namespace {

bool isMissingToken(std::string token) {
    std::transform(token.begin(), token.end(), token.begin(),
                   [](unsigned char ch) { return std::tolower(ch); });
    return token == "-" || token == "na" || token == "nan";
}

double parseField(const std::string &token, const std::string &line) {
    if (isMissingToken(token)) return kMissing;
    size_t used = 0;
    double value;
    try {
        value = std::stod(token, &used);
    } catch (const std::logic_error &) {
        throw ParseError("Malformed number '" + token + "' in line: " + line);
    }
    if (used != token.size() || !std::isfinite(value)) {
        throw ParseError("Malformed number '" + token + "' in line: " + line);
    }
    return value;
}

}  // namespace

std::vector<DailyObservation> parseRecords(std::istream &input) {
    std::vector<DailyObservation> records;
    std::string line;
    std::unordered_set<std::string> seen;

    while (std::getline(input, line)) {
        line.erase(line.find_last_not_of(" \n\r\t") + 1);
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        std::vector<std::string> fields{std::istream_iterator<std::string>{iss},
                                        std::istream_iterator<std::string>{}};
        if (fields.size() < 2 || fields.size() > 6) {
            throw ParseError("Malformed line: " + line);
        }
        if (seen.count(fields[0])) {
            throw ParseError("Duplicate date: " + fields[0]);
        }
        seen.insert(fields[0]);

        DailyObservation obs;
        obs.date = Date::parse(fields[0]);
        obs.intakeKcal = parseField(fields[1], line);
        if (fields.size() > 2) obs.workoutKcal = parseField(fields[2], line);
        if (fields.size() > 3) obs.carbohydrateG = parseField(fields[3], line);
        if (fields.size() > 4) obs.rawFatMassKg = parseField(fields[4], line);
        if (fields.size() > 5) obs.rawLeanMassKg = parseField(fields[5], line);

        if (std::isnan(obs.workoutKcal)) obs.workoutKcal = 0.0;
        if (std::isnan(obs.carbohydrateG)) obs.carbohydrateG = 0.0;

        if (obs.intakeKcal < 0 || obs.workoutKcal < 0 || obs.carbohydrateG < 0 ||
            obs.rawFatMassKg <= 0 || obs.rawLeanMassKg <= 0) {
            throw ParseError("Invalid energy or mass values: " + line);
        }
        records.push_back(obs);
    }

    std::sort(records.begin(), records.end(),
              [](const DailyObservation &a, const DailyObservation &b) {
                  return a.date < b.date;
              });
    return records;
}

}  // namespace fmcal
