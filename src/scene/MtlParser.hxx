#ifndef __MTLPARSER_HXX__
#define __MTLPARSER_HXX__

#include <istream>
#include <string>
#include <vector>

#include "Material.hxx"
#include "ParseError.hxx"

namespace scene {

// Parse Wavefront MTL text into raw per-material statements. Statement keys
// are lower-cased; color and scalar statements are checked for arity.
std::vector<MaterialDefinition> parseMtl(std::istream &in, const std::string &source);

} // namespace scene

#endif // __MTLPARSER_HXX__
