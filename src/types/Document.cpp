#include <types/Document.hpp>
#include <util.hpp>


Document::Document(Session* session) : Node(session) {}

Document::~Document() {
    for (Node* child : children) {
        delete child;
    }
}

void Document::render(WeaveWriter* out) {
    for (Node* child : children) {
        child -> render(out);
        if (failed) {
            break;
        }
    }
}

void Document::addChild(Node* child) {
    child -> parent = this;
    children.push_back(child);
}

std::string Document::figurePrefix() {
    return trim2dir(outputPath) + "figure/" + stem(outputPath);
}

std::string Document::relativeToOutput(std::string path) {
    std::string dir = trim2dir(outputPath);
    if (dir.size() > 0 && path.compare(0, dir.size(), dir) == 0) {
        return path.substr(dir.size());
    }
    return path;
}
