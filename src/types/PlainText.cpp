#include <types/PlainText.hpp>


PlainText::PlainText(Session* session, MapView d) : Node(session), data(d) {}

void PlainText::render(WeaveWriter* stream) {
    stream -> write(data);
}
