#include "scene/MtlParser.hxx"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace scene {

// Same conversion MaterialSet uses, so out-of-range values fail here.
static bool isNumber(const std::string &s) {
    try {
        std::size_t used = 0;
        std::stof(s, &used);
        return used == s.size();
    } catch (const std::exception &) {
        return false;
    }
}

std::vector<MaterialDefinition> parseMtl(std::istream &in, const std::string &source) {
    std::vector<MaterialDefinition> defs;

    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        std::istringstream iss(line);
        std::string key;
        if (!(iss >> key) || key[0] == '#') continue;
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        std::vector<std::string> args;
        std::string tok;
        while (iss >> tok) {
            args.push_back(tok);
        }

        if (key == "newmtl") {
            if (args.empty()) {
                throw ParseError(source, lineNo, "newmtl without a name");
            }
            MaterialDefinition def;
            def.name = args[0];
            defs.push_back(std::move(def));
            continue;
        }

        if (defs.empty()) {
            throw ParseError(source, lineNo, "'" + key + "' before any newmtl");
        }

        std::size_t arity = 0;
        if (key == "ka" || key == "kd" || key == "ks" || key == "ke") {
            arity = 3;
        } else if (key == "ns" || key == "d" || key == "tr" || key == "ni" || key == "illum") {
            arity = 1;
        }
        if (arity == 3 && args.size() == 1) {
            args.resize(3, args[0]); // grey shorthand: "Kd 0.5"
        }
        if (arity > 0) {
            if (args.size() < arity) {
                throw ParseError(source, lineNo, "'" + key + "' expects " + std::to_string(arity) + " values");
            }
            args.resize(arity);
            for (const auto &a : args) {
                if (!isNumber(a)) {
                    throw ParseError(source, lineNo, "'" + key + "' value '" + a + "' is not a number");
                }
            }
        } else if (key.compare(0, 4, "map_") == 0 || key == "bump") {
            if (args.empty()) {
                throw ParseError(source, lineNo, "'" + key + "' without a file name");
            }
        }

        defs.back().statements.push_back(MaterialStatement{key, std::move(args)});
    }

    return defs;
}

} // namespace scene
