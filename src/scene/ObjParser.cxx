// ObjParser.cxx
#include "scene/ObjParser.hxx"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_map>

namespace scene {

// Parse one OBJ index field ("12", "-3"). Empty fields are legal ("1//3") and yield 0.
static bool parse_obj_field(const std::string &s, int &out) {
	if (s.empty()) {
		out = 0;
		return true;
	}
	try {
		std::size_t used = 0;
		out = std::stoi(s, &used);
		return used == s.size() && out != 0;
	} catch (const std::exception &) {
		return false;
	}
}

// Split "i", "i/j", "i//k" or "i/j/k" into its raw (1-based or negative) fields.
static bool parse_obj_index(const std::string &tok, int &vi, int &ti, int &ni) {
	std::string fields[3];
	int n = 0;
	std::size_t start = 0;
	while (n < 3) {
		std::size_t slash = tok.find('/', start);
		fields[n++] = tok.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
		if (slash == std::string::npos) break;
		start = slash + 1;
	}
	if (fields[0].empty()) return false;
	return parse_obj_field(fields[0], vi) && parse_obj_field(fields[1], ti) && parse_obj_field(fields[2], ni);
}

static double read_number(std::istringstream &iss, const std::string &source, int lineNo, const char *what) {
	double x = 0.0;
	if (!(iss >> x)) {
		throw ParseError(source, lineNo, std::string("expected number in '") + what + "' statement");
	}
	return x;
}

ObjModel parseObj(std::istream &in, const std::string &source) {
	ObjModel model;
	model.groups.push_back(ObjGroup{});

	// Start a new group unless the current one is still empty.
	auto beginGroup = [&model](const std::string &object, const std::string &material) {
		ObjGroup &cur = model.groups.back();
		if (cur.faces.empty()) {
			cur.object = object;
			cur.material = material;
			return;
		}
		model.groups.push_back(ObjGroup{object, material, {}});
	};

	std::string line;
	int lineNo = 0;
	while (std::getline(in, line)) {
		++lineNo;
		if (lineNo == 1 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
			line.erase(0, 3); // UTF-8 byte order mark
		}
		// Trim leading spaces
		auto ltrim = [](std::string &s){ s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch){ return !std::isspace(ch); })); };
		ltrim(line);
		if (line.empty() || line[0] == '#') continue;

		std::istringstream iss(line);
		std::string tag;
		iss >> tag;
		if (tag == "v") {
			double x = read_number(iss, source, lineNo, "v");
			double y = read_number(iss, source, lineNo, "v");
			double z = read_number(iss, source, lineNo, "v");
			model.positions.emplace_back(x, y, z);
		} else if (tag == "vn") {
			double x = read_number(iss, source, lineNo, "vn");
			double y = read_number(iss, source, lineNo, "vn");
			double z = read_number(iss, source, lineNo, "vn");
			model.normals.emplace_back(x, y, z);
		} else if (tag == "vt") {
			double u = read_number(iss, source, lineNo, "vt");
			double v = 0.0;
			iss >> v; // optional
			model.uvs.emplace_back(u, v);
		} else if (tag == "f") {
			std::vector<ObjIndex> corners;
			std::string tok;
			while (iss >> tok) {
				int vi = 0, ti = 0, ni = 0;
				if (!parse_obj_index(tok, vi, ti, ni)) {
					throw ParseError(source, lineNo, "malformed face index '" + tok + "'");
				}

				// OBJ is 1-based; negative indices are relative to the end. 0 means absent.
				auto resolveIndex = [&](int idx, std::size_t count, const char *what) -> int {
					if (idx == 0) return -1;
					int n = static_cast<int>(count);
					int r = idx > 0 ? idx - 1 : n + idx;
					if (r < 0 || r >= n) {
						throw ParseError(source, lineNo, std::string(what) + " index " + std::to_string(idx) + " out of range");
					}
					return r;
				};

				ObjIndex c;
				c.v = resolveIndex(vi, model.positions.size(), "vertex");
				c.vt = resolveIndex(ti, model.uvs.size(), "texture coordinate");
				c.vn = resolveIndex(ni, model.normals.size(), "normal");
				corners.push_back(c);
			}

			if (corners.size() < 3) {
				continue; // ignore degenerate faces
			}

			// Triangulate polygon using a fan: (0,i,i+1)
			ObjGroup &g = model.groups.back();
			for (size_t i = 1; i + 1 < corners.size(); ++i) {
				g.faces.push_back(ObjTriangle{corners[0], corners[i], corners[i + 1]});
			}
		} else if (tag == "o" || tag == "g") {
			std::string name;
			std::getline(iss >> std::ws, name);
			beginGroup(name, model.groups.back().material);
		} else if (tag == "usemtl") {
			std::string name;
			iss >> name;
			beginGroup(model.groups.back().object, name);
		} else if (tag == "mtllib") {
			std::string lib;
			while (iss >> lib) {
				model.materialLibraries.push_back(lib);
			}
		}
		// ignore other tags (s, l, p, ...)
	}

	model.groups.erase(std::remove_if(model.groups.begin(), model.groups.end(),
	                                  [](const ObjGroup &g) { return g.faces.empty(); }),
	                   model.groups.end());
	return model;
}

static std::shared_ptr<Geometry> buildGeometry(const ObjModel &model, const ObjGroup &group) {
	auto geometry = std::make_shared<Geometry>();

	// Each distinct (v, vt, vn) corner becomes one vertex.
	std::unordered_map<ObjIndex, int, ObjIndexHash> vertexMap;
	vertexMap.reserve(group.faces.size() * 3);

	bool hasNormals = true;
	bool hasUvs = true;
	for (const auto &f : group.faces) {
		for (const auto &c : f) {
			hasNormals = hasNormals && c.vn >= 0;
			hasUvs = hasUvs && c.vt >= 0;
		}
	}

	for (const auto &f : group.faces) {
		Triangle tri;
		for (int k = 0; k < 3; ++k) {
			const ObjIndex &c = f[k];
			auto it = vertexMap.find(c);
			if (it != vertexMap.end()) {
				tri[k] = it->second;
				continue;
			}
			int id = static_cast<int>(geometry->positions.size());
			geometry->positions.push_back(model.positions[c.v]);
			if (hasNormals) geometry->normals.push_back(model.normals[c.vn].normalized());
			if (hasUvs) geometry->uvs.push_back(model.uvs[c.vt]);
			vertexMap.emplace(c, id);
			tri[k] = id;
		}
		geometry->triangles.push_back(tri);
	}

	if (!hasNormals) {
		geometry->computeVertexNormals();
	}
	return geometry;
}

std::unique_ptr<Group> buildObject(const ObjModel &model, MaterialSet *materials) {
	auto root = std::make_unique<Group>();

	for (const auto &group : model.groups) {
		std::shared_ptr<const Material> material;
		if (materials && !group.material.empty()) {
			material = materials->create(group.material);
		}
		if (!material) {
			material = Material::defaultMaterial();
		}

		auto mesh = std::make_unique<MeshNode>(buildGeometry(model, group), material);
		mesh->name = group.object;
		root->add(std::move(mesh));
	}
	return root;
}

} // namespace scene
