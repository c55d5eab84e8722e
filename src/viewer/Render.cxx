#include "viewer/Render.hxx"

#include <algorithm>
#include <cmath>

#include <Eigen/Dense>

namespace viewer {

// ============================================================================
// Overlay text
// ============================================================================

namespace {

const float kGlyphScale = 2.0f;
const float kGlyphAdvance = 6.0f * kGlyphScale; // 5 pixels + 1 spacing
const float kLineHeight = 8.0f * kGlyphScale;   // 7 pixels + 1 spacing

// Orthographic framebuffer-pixel projection (top-left origin) for the lifetime of the object.
struct ScreenSpace {
    int width = 0;
    int height = 0;

    explicit ScreenSpace(GLFWwindow *window) {
        glfwGetFramebufferSize(window, &width, &height);
        glMatrixMode(GL_PROJECTION);
        glPushMatrix();
        glLoadIdentity();
        glOrtho(0, width, height, 0, -1, 1);
        glMatrixMode(GL_MODELVIEW);
        glPushMatrix();
        glLoadIdentity();
    }

    ~ScreenSpace() {
        glMatrixMode(GL_MODELVIEW);
        glPopMatrix();
        glMatrixMode(GL_PROJECTION);
        glPopMatrix();
        glMatrixMode(GL_MODELVIEW);
    }
};

void rect(GLenum mode, float x0, float y0, float x1, float y1) {
    glBegin(mode);
    glVertex2f(x0, y0);
    glVertex2f(x1, y0);
    glVertex2f(x1, y1);
    glVertex2f(x0, y1);
    glEnd();
}

} // namespace

// Simple 5x7 bitmap font for basic ASCII characters (space through ~)
// Each character is stored as 7 bytes, one per row, with 5 bits per row.
static const unsigned char kFont5x7[95][7] = {
    {0x00,0x00,0x00,0x00,0x00,0x00,0x00}, // ' '
    {0x04,0x04,0x04,0x04,0x04,0x00,0x04}, // '!'
    {0x0A,0x0A,0x00,0x00,0x00,0x00,0x00}, // '"'
    {0x0A,0x0A,0x1F,0x0A,0x1F,0x0A,0x0A}, // '#'
    {0x04,0x0F,0x14,0x0E,0x05,0x1E,0x04}, // '$'
    {0x18,0x19,0x02,0x04,0x08,0x13,0x03}, // '%'
    {0x08,0x14,0x14,0x08,0x15,0x12,0x0D}, // '&'
    {0x04,0x04,0x00,0x00,0x00,0x00,0x00}, // '\''
    {0x02,0x04,0x08,0x08,0x08,0x04,0x02}, // '('
    {0x08,0x04,0x02,0x02,0x02,0x04,0x08}, // ')'
    {0x00,0x04,0x15,0x0E,0x15,0x04,0x00}, // '*'
    {0x00,0x04,0x04,0x1F,0x04,0x04,0x00}, // '+'
    {0x00,0x00,0x00,0x00,0x00,0x04,0x08}, // ','
    {0x00,0x00,0x00,0x1F,0x00,0x00,0x00}, // '-'
    {0x00,0x00,0x00,0x00,0x00,0x00,0x04}, // '.'
    {0x00,0x01,0x02,0x04,0x08,0x10,0x00}, // '/'
    {0x0E,0x11,0x13,0x15,0x19,0x11,0x0E}, // '0'
    {0x04,0x0C,0x04,0x04,0x04,0x04,0x0E}, // '1'
    {0x0E,0x11,0x01,0x06,0x08,0x10,0x1F}, // '2'
    {0x0E,0x11,0x01,0x06,0x01,0x11,0x0E}, // '3'
    {0x02,0x06,0x0A,0x12,0x1F,0x02,0x02}, // '4'
    {0x1F,0x10,0x1E,0x01,0x01,0x11,0x0E}, // '5'
    {0x06,0x08,0x10,0x1E,0x11,0x11,0x0E}, // '6'
    {0x1F,0x01,0x02,0x04,0x08,0x08,0x08}, // '7'
    {0x0E,0x11,0x11,0x0E,0x11,0x11,0x0E}, // '8'
    {0x0E,0x11,0x11,0x0F,0x01,0x02,0x0C}, // '9'
    {0x00,0x00,0x04,0x00,0x00,0x04,0x00}, // ':'
    {0x00,0x00,0x04,0x00,0x00,0x04,0x08}, // ';'
    {0x02,0x04,0x08,0x10,0x08,0x04,0x02}, // '<'
    {0x00,0x00,0x1F,0x00,0x1F,0x00,0x00}, // '='
    {0x08,0x04,0x02,0x01,0x02,0x04,0x08}, // '>'
    {0x0E,0x11,0x01,0x06,0x04,0x00,0x04}, // '?'
    {0x0E,0x11,0x17,0x15,0x17,0x10,0x0E}, // '@'
    {0x0E,0x11,0x11,0x1F,0x11,0x11,0x11}, // 'A'
    {0x1E,0x11,0x11,0x1E,0x11,0x11,0x1E}, // 'B'
    {0x0E,0x11,0x10,0x10,0x10,0x11,0x0E}, // 'C'
    {0x1E,0x11,0x11,0x11,0x11,0x11,0x1E}, // 'D'
    {0x1F,0x10,0x10,0x1E,0x10,0x10,0x1F}, // 'E'
    {0x1F,0x10,0x10,0x1E,0x10,0x10,0x10}, // 'F'
    {0x0E,0x11,0x10,0x17,0x11,0x11,0x0E}, // 'G'
    {0x11,0x11,0x11,0x1F,0x11,0x11,0x11}, // 'H'
    {0x0E,0x04,0x04,0x04,0x04,0x04,0x0E}, // 'I'
    {0x07,0x02,0x02,0x02,0x02,0x12,0x0C}, // 'J'
    {0x11,0x12,0x14,0x18,0x14,0x12,0x11}, // 'K'
    {0x10,0x10,0x10,0x10,0x10,0x10,0x1F}, // 'L'
    {0x11,0x1B,0x15,0x15,0x11,0x11,0x11}, // 'M'
    {0x11,0x19,0x15,0x13,0x11,0x11,0x11}, // 'N'
    {0x0E,0x11,0x11,0x11,0x11,0x11,0x0E}, // 'O'
    {0x1E,0x11,0x11,0x1E,0x10,0x10,0x10}, // 'P'
    {0x0E,0x11,0x11,0x11,0x15,0x12,0x0D}, // 'Q'
    {0x1E,0x11,0x11,0x1E,0x14,0x12,0x11}, // 'R'
    {0x0E,0x11,0x10,0x0E,0x01,0x11,0x0E}, // 'S'
    {0x1F,0x04,0x04,0x04,0x04,0x04,0x04}, // 'T'
    {0x11,0x11,0x11,0x11,0x11,0x11,0x0E}, // 'U'
    {0x11,0x11,0x11,0x11,0x11,0x0A,0x04}, // 'V'
    {0x11,0x11,0x11,0x15,0x15,0x1B,0x11}, // 'W'
    {0x11,0x11,0x0A,0x04,0x0A,0x11,0x11}, // 'X'
    {0x11,0x11,0x0A,0x04,0x04,0x04,0x04}, // 'Y'
    {0x1F,0x01,0x02,0x04,0x08,0x10,0x1F}, // 'Z'
    {0x0E,0x08,0x08,0x08,0x08,0x08,0x0E}, // '['
    {0x00,0x10,0x08,0x04,0x02,0x01,0x00}, // '\\'
    {0x0E,0x02,0x02,0x02,0x02,0x02,0x0E}, // ']'
    {0x04,0x0A,0x11,0x00,0x00,0x00,0x00}, // '^'
    {0x00,0x00,0x00,0x00,0x00,0x00,0x1F}, // '_'
    {0x08,0x04,0x00,0x00,0x00,0x00,0x00}, // '`'
    {0x00,0x00,0x0E,0x01,0x0F,0x11,0x0F}, // 'a'
    {0x10,0x10,0x1E,0x11,0x11,0x11,0x1E}, // 'b'
    {0x00,0x00,0x0E,0x11,0x10,0x11,0x0E}, // 'c'
    {0x01,0x01,0x0F,0x11,0x11,0x11,0x0F}, // 'd'
    {0x00,0x00,0x0E,0x11,0x1F,0x10,0x0E}, // 'e'
    {0x06,0x08,0x1E,0x08,0x08,0x08,0x08}, // 'f'
    {0x00,0x00,0x0F,0x11,0x0F,0x01,0x0E}, // 'g'
    {0x10,0x10,0x1E,0x11,0x11,0x11,0x11}, // 'h'
    {0x04,0x00,0x0C,0x04,0x04,0x04,0x0E}, // 'i'
    {0x02,0x00,0x06,0x02,0x02,0x12,0x0C}, // 'j'
    {0x10,0x10,0x12,0x14,0x18,0x14,0x12}, // 'k'
    {0x0C,0x04,0x04,0x04,0x04,0x04,0x0E}, // 'l'
    {0x00,0x00,0x1A,0x15,0x15,0x11,0x11}, // 'm'
    {0x00,0x00,0x1E,0x11,0x11,0x11,0x11}, // 'n'
    {0x00,0x00,0x0E,0x11,0x11,0x11,0x0E}, // 'o'
    {0x00,0x00,0x1E,0x11,0x1E,0x10,0x10}, // 'p'
    {0x00,0x00,0x0F,0x11,0x0F,0x01,0x01}, // 'q'
    {0x00,0x00,0x16,0x19,0x10,0x10,0x10}, // 'r'
    {0x00,0x00,0x0F,0x10,0x0E,0x01,0x1E}, // 's'
    {0x08,0x08,0x1E,0x08,0x08,0x09,0x06}, // 't'
    {0x00,0x00,0x11,0x11,0x11,0x11,0x0F}, // 'u'
    {0x00,0x00,0x11,0x11,0x11,0x0A,0x04}, // 'v'
    {0x00,0x00,0x11,0x11,0x15,0x15,0x0A}, // 'w'
    {0x00,0x00,0x11,0x0A,0x04,0x0A,0x11}, // 'x'
    {0x00,0x00,0x11,0x11,0x0F,0x01,0x0E}, // 'y'
    {0x00,0x00,0x1F,0x02,0x04,0x08,0x1F}, // 'z'
    {0x02,0x04,0x04,0x08,0x04,0x04,0x02}, // '{'
    {0x04,0x04,0x04,0x04,0x04,0x04,0x04}, // '|'
    {0x08,0x04,0x04,0x02,0x04,0x04,0x08}, // '}'
    {0x00,0x00,0x08,0x15,0x02,0x00,0x00}, // '~'
};

void drawTextOverlay(GLFWwindow *window, const char *text, float x, float y, float r, float g, float b) {
    ScreenSpace screen(window);
    glColor3f(r, g, b);

    float penX = x;
    float penY = y;

    glBegin(GL_QUADS);
    for (const char *p = text; *p; ++p) {
        if (*p == '\n') {
            penX = x;
            penY += kLineHeight;
            continue;
        }

        int ch = static_cast<unsigned char>(*p);
        if (ch < 32 || ch > 126) ch = '?';
        const unsigned char *glyph = kFont5x7[ch - 32];

        // one quad per lit pixel
        for (int row = 0; row < 7; ++row) {
            for (int col = 0; col < 5; ++col) {
                if (!(glyph[row] & (0x10 >> col))) continue;
                float px = penX + col * kGlyphScale;
                float py = penY + row * kGlyphScale;
                glVertex2f(px, py);
                glVertex2f(px + kGlyphScale, py);
                glVertex2f(px + kGlyphScale, py + kGlyphScale);
                glVertex2f(px, py + kGlyphScale);
            }
        }
        penX += kGlyphAdvance;
    }
    glEnd();
}

// ============================================================================
// Console
// ============================================================================

void Console::log(const std::string &msg) {
    lines_.push_back(msg);
    while (static_cast<int>(lines_.size()) > maxLines_) {
        lines_.erase(lines_.begin());
    }
}

void Console::clear() {
    lines_.clear();
}

void Console::draw(GLFWwindow *window, float startY) const {
    if (lines_.empty()) return;

    std::size_t longest = 0;
    for (const auto &line : lines_) {
        longest = std::max(longest, line.size());
    }

    const float padding = 8.0f;
    const float lineSpacing = kLineHeight + 2.0f;
    {
        ScreenSpace screen(window);
        float x0 = 10.0f;
        float y0 = startY - padding;
        float x1 = std::min(static_cast<float>(screen.width) - 10.0f, x0 + 2.0f * padding + longest * kGlyphAdvance);
        float y1 = y0 + lines_.size() * lineSpacing + 2.0f * padding;

        glColor4f(0.0f, 0.0f, 0.0f, 0.6f);
        rect(GL_QUADS, x0, y0, x1, y1);
        glColor3f(0.3f, 0.6f, 0.3f);
        glLineWidth(1.0f);
        rect(GL_LINE_LOOP, x0, y0, x1, y1);
    }

    float y = startY;
    for (const auto &line : lines_) {
        drawTextOverlay(window, line.c_str(), 10.0f + padding, y, 0.4f, 0.9f, 0.4f);
        y += lineSpacing;
    }
}

// ============================================================================
// Scene drawing
// ============================================================================

GLRenderer::GLRenderer(GLFWwindow *window, const Console *console) : window_(window), console_(console) {}

void GLRenderer::setSize(double width, double height) {
    width_ = std::max(1.0, width);
    height_ = std::max(1.0, height);
}

static void colorToGL(const scene::Color &c, float scale, float alpha, float out[4]) {
    out[0] = c[0] * scale;
    out[1] = c[1] * scale;
    out[2] = c[2] * scale;
    out[3] = alpha;
}

void GLRenderer::setupLights(const scene::Scene &scene) const {
    float ambient[4] = {0.0f, 0.0f, 0.0f, 1.0f};
    int nextLight = 0;

    scene.traverse([&](const scene::Object3D &node) {
        if (!node.visible) return;
        if (node.kind() == scene::Object3D::Kind::AmbientLight) {
            const auto &l = static_cast<const scene::AmbientLight &>(node);
            for (int k = 0; k < 3; ++k) ambient[k] += l.color[k] * l.intensity;
        } else if (node.kind() == scene::Object3D::Kind::PointLight) {
            if (nextLight >= 8) return; // fixed-function limit
            const auto &l = static_cast<const scene::PointLight &>(node);
            GLenum id = GL_LIGHT0 + nextLight++;

            Eigen::Vector3d p = node.worldTransform().translation();
            float pos[4] = {static_cast<float>(p.x()), static_cast<float>(p.y()), static_cast<float>(p.z()), 1.0f};
            float diffuse[4];
            colorToGL(l.color, l.intensity, 1.0f, diffuse);
            float black[4] = {0.0f, 0.0f, 0.0f, 1.0f};

            glEnable(id);
            glLightfv(id, GL_POSITION, pos);
            glLightfv(id, GL_DIFFUSE, diffuse);
            glLightfv(id, GL_SPECULAR, diffuse);
            glLightfv(id, GL_AMBIENT, black);
        }
    });

    for (int i = nextLight; i < 8; ++i) {
        glDisable(GL_LIGHT0 + i);
    }
    glLightModelfv(GL_LIGHT_MODEL_AMBIENT, ambient);
}

static void drawMesh(const scene::MeshNode &mesh) {
    const scene::Geometry &g = *mesh.geometry;
    const scene::Material &m = mesh.material ? *mesh.material : *scene::Material::defaultMaterial();

    float c[4];
    // Ambient response follows the diffuse color.
    colorToGL(m.diffuse, 1.0f, m.opacity, c);
    glMaterialfv(GL_FRONT_AND_BACK, GL_AMBIENT, c);
    glMaterialfv(GL_FRONT_AND_BACK, GL_DIFFUSE, c);
    colorToGL(m.specular, 1.0f, m.opacity, c);
    glMaterialfv(GL_FRONT_AND_BACK, GL_SPECULAR, c);
    colorToGL(m.emissive, 1.0f, m.opacity, c);
    glMaterialfv(GL_FRONT_AND_BACK, GL_EMISSION, c);
    glMaterialf(GL_FRONT_AND_BACK, GL_SHININESS, std::min(128.0f, std::max(0.0f, m.shininess)));

    const bool hasNormals = g.normals.size() == g.positions.size();

    glBegin(GL_TRIANGLES);
    for (const auto &tri : g.triangles) {
        for (int k = 0; k < 3; ++k) {
            if (hasNormals) {
                const scene::Point &n = g.normals[tri[k]];
                glNormal3d(n.x(), n.y(), n.z());
            }
            const scene::Point &p = g.positions[tri[k]];
            glVertex3d(p.x(), p.y(), p.z());
        }
    }
    glEnd();
}

void GLRenderer::drawNode(const scene::Object3D &node) const {
    if (!node.visible || node.kind() == scene::Object3D::Kind::Camera) return;

    glPushMatrix();
    Eigen::Matrix4d local = node.localTransform().matrix();
    glMultMatrixd(local.data());

    if (node.kind() == scene::Object3D::Kind::Mesh) {
        const auto &mesh = static_cast<const scene::MeshNode &>(node);
        if (mesh.geometry && !mesh.geometry->empty()) {
            drawMesh(mesh);
        }
    }
    for (const auto &child : node.children()) {
        drawNode(*child);
    }

    glPopMatrix();
}

void GLRenderer::render(const scene::Scene &scene, const scene::PerspectiveCamera &camera) {
    int dw = static_cast<int>(std::lround(width_ * pixelRatio_));
    int dh = static_cast<int>(std::lround(height_ * pixelRatio_));
    // The window may not have applied the last size yet; never draw past its framebuffer.
    int fbw = 0, fbh = 0;
    glfwGetFramebufferSize(window_, &fbw, &fbh);
    glViewport(0, 0, std::max(1, std::min(dw, fbw)), std::max(1, std::min(dh, fbh)));

    glClearColor(clear_[0], clear_[1], clear_[2], 1.0f);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

    glEnable(GL_DEPTH_TEST);
    glEnable(GL_LIGHTING);
    glEnable(GL_NORMALIZE);
    glShadeModel(GL_SMOOTH);

    Eigen::Matrix4d projection = camera.projectionMatrix();
    glMatrixMode(GL_PROJECTION);
    glLoadMatrixd(projection.data());

    // Light positions are given in world space, so load the view matrix first.
    Eigen::Matrix4d view = camera.viewMatrix();
    glMatrixMode(GL_MODELVIEW);
    glLoadMatrixd(view.data());
    setupLights(scene);

    drawNode(scene);

    glDisable(GL_LIGHTING);
    glDisable(GL_DEPTH_TEST);

    if (console_) {
        console_->draw(window_);
    }

    glfwSwapBuffers(window_);
}

} // namespace viewer
