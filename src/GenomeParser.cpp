#include "level_populator/GenomeParser.h"
#include "level_populator/Errors.h"
#include <cctype>
#include <climits>
#include <sstream>

namespace level_populator {

namespace {

// Character-driven cursor over a genome line
class GenomeCursor {
public:
    explicit GenomeCursor(const std::string& text) : text_(text) {}

    bool atEnd() const { return pos_ >= text_.size(); }
    char peek() const { return atEnd() ? '\0' : text_[pos_]; }
    size_t position() const { return pos_; }

    void expect(char c) {
        if (atEnd()) {
            throw ParseError(std::string("Unterminated token, expected '") + c + "'", pos_);
        }
        if (text_[pos_] != c) {
            throw ParseError(std::string("Expected '") + c + "' but found '" + text_[pos_] + "'", pos_);
        }
        ++pos_;
    }

    int readInt(bool allowSign) {
        size_t start = pos_;
        bool negative = false;
        if (allowSign && peek() == '-') {
            negative = true;
            ++pos_;
        }
        if (atEnd()) {
            throw ParseError("Unterminated token, expected a digit", pos_);
        }
        if (!std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            throw ParseError(std::string("Expected a digit but found '") + text_[pos_] + "'", pos_);
        }

        long long value = 0;
        while (!atEnd() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            value = value * 10 + (text_[pos_] - '0');
            if (value > INT_MAX) {
                throw ParseError("Number out of range", start);
            }
            ++pos_;
        }
        return static_cast<int>(negative ? -value : value);
    }

    void skipWhitespace() {
        while (!atEnd() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

private:
    const std::string& text_;
    size_t pos_ = 0;
};

// Far corner coordinate, rejected when it leaves the int range
int endCoordinate(long long end, size_t tokenStart) {
    if (end > INT_MAX || end < INT_MIN) {
        throw ParseError("Token extends past the coordinate range", tokenStart);
    }
    return static_cast<int>(end);
}

Room parseRoomToken(GenomeCursor& cursor) {
    const size_t tokenStart = cursor.position();
    cursor.expect('<');
    Room room;
    room.isCorridor = false;
    room.originX = cursor.readInt(false);
    cursor.expect(',');
    room.originY = cursor.readInt(false);
    cursor.expect(',');
    int size = cursor.readInt(false);
    cursor.expect('>');

    room.endX = endCoordinate(static_cast<long long>(room.originX) + size - 1, tokenStart);
    room.endY = endCoordinate(static_cast<long long>(room.originY) + size - 1, tokenStart);
    return room;
}

Room parseCorridorToken(GenomeCursor& cursor) {
    const size_t tokenStart = cursor.position();
    cursor.expect('<');
    Room corridor;
    corridor.isCorridor = true;
    corridor.originX = cursor.readInt(false);
    cursor.expect(',');
    corridor.originY = cursor.readInt(false);
    cursor.expect(',');
    int length = cursor.readInt(true);
    cursor.expect('>');

    const long long originX = corridor.originX;
    const long long originY = corridor.originY;
    if (length > 0) {
        corridor.endX = endCoordinate(originX + length - 1, tokenStart);
        corridor.endY = endCoordinate(originY + 3 - 1, tokenStart);
    } else {
        corridor.endX = endCoordinate(originX + 3 - 1, tokenStart);
        corridor.endY = endCoordinate(originY - length - 1, tokenStart);
    }
    return corridor;
}

} // namespace

std::vector<Room> parseGenome(const std::string& genome) {
    std::vector<Room> rooms;
    GenomeCursor cursor(genome);

    while (cursor.peek() == '<') {
        rooms.push_back(parseRoomToken(cursor));
    }

    if (cursor.peek() == '|') {
        cursor.expect('|');
        while (cursor.peek() == '<') {
            rooms.push_back(parseCorridorToken(cursor));
        }
    }

    cursor.skipWhitespace();
    if (!cursor.atEnd()) {
        throw ParseError(std::string("Unexpected character '") + cursor.peek() + "'", cursor.position());
    }

    return rooms;
}

std::string serializeGenome(const std::vector<Room>& rooms) {
    std::ostringstream roomPart;
    std::ostringstream corridorPart;
    bool hasCorridors = false;

    for (const Room& room : rooms) {
        int sizeX = room.sizeX();
        int sizeY = room.sizeY();

        if (!room.isCorridor) {
            if (sizeX != sizeY || sizeX <= 0) {
                throw GeometryError("Cannot encode non-square " + room.describe());
            }
            roomPart << '<' << room.originX << ',' << room.originY << ',' << sizeX << '>';
            continue;
        }

        hasCorridors = true;
        if (sizeY == 3 && sizeX != 3 && sizeX > 0) {
            corridorPart << '<' << room.originX << ',' << room.originY << ',' << sizeX << '>';
        } else if (sizeX == 3 && sizeY >= 0) {
            corridorPart << '<' << room.originX << ',' << room.originY << ',' << -sizeY << '>';
        } else {
            throw GeometryError("Cannot encode " + room.describe() + " without a 3 tile side");
        }
    }

    std::string genome = roomPart.str();
    if (hasCorridors) {
        genome += '|';
        genome += corridorPart.str();
    }
    return genome;
}

} // namespace level_populator
