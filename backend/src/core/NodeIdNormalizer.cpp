#include "NodeIdNormalizer.hpp"
#include <cctype>
#include <stdexcept>
#include <utility>

static std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) ++b;
    while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

static bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

static bool isIri(const std::string& s) {
    return startsWith(s, "http://") || startsWith(s, "https://");
}

NodeIdNormalizer::NodeIdNormalizer()
    : bindings(defaultNamespaces())
{
}

NodeIdNormalizer::NodeIdNormalizer(std::vector<NamespaceBinding> namespaces)
    : bindings(std::move(namespaces))
{
    if (bindings.empty()) {
        throw std::invalid_argument("NodeIdNormalizer needs at least one namespace");
    }
}

std::vector<NamespaceBinding> NodeIdNormalizer::defaultNamespaces() {
    return {
        {"srs-kg", "http://srs4autism.com/schema/"},
        {"srs-inst", "http://srs4autism.com/instance/"},
    };
}

std::string NodeIdNormalizer::percentDecode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size() &&
            std::isxdigit((unsigned char)text[i + 1]) && std::isxdigit((unsigned char)text[i + 2]))
        {
            out.push_back(static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        }
        else {
            out.push_back(text[i]);
        }
    }
    return isValidUtf8(out) ? out : text;
}

bool NodeIdNormalizer::isValidUtf8(const std::string& text) {
    std::size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        std::size_t len = 0;
        unsigned int cp = 0;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > text.size()) return false;
        for (std::size_t k = 1; k < len; ++k) {
            unsigned char cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cont & 0x3F);
        }

        // Overlong forms, surrogates and code points past U+10FFFF
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) return false;
        i += len;
    }
    return true;
}

std::string NodeIdNormalizer::normalize(const std::string& raw) const {
    std::string id = trim(raw);
    if (id.empty()) return id;

    if (isIri(id)) {
        for (const auto& ns : bindings) {
            if (startsWith(id, ns.base)) {
                std::string local = id.substr(ns.base.size());
                auto slash = local.rfind('/');
                if (slash != std::string::npos) local = local.substr(slash + 1);
                return ns.prefix + ":" + percentDecode(local);
            }
        }
        return id;
    }

    auto colon = id.find(':');
    if (colon != std::string::npos) {
        return id.substr(0, colon + 1) + percentDecode(id.substr(colon + 1));
    }

    return bindings.front().prefix + ":" + percentDecode(id);
}
