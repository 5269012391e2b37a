#include "room/RoomDetector.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace floorplan::core::room;
using floorplan::core::plan::Vec2d;
using floorplan::core::plan::WallID;

namespace {

struct TestResult {
    bool pass = false;
    std::string expected;
    std::string got;
};

bool approx(double a, double b, double tol = 1e-9) {
    return std::abs(a - b) <= tol;
}

WallInput wall(const std::string& id, double x1, double y1, double x2, double y2) {
    return WallInput{id, {x1, y1}, {x2, y2}};
}

std::vector<WallInput> rectangle(double w, double h) {
    return {
        wall("w1", 0.0, 0.0, w, 0.0),
        wall("w2", w, 0.0, w, h),
        wall("w3", w, h, 0.0, h),
        wall("w4", 0.0, h, 0.0, 0.0)
    };
}

// Two 4x3 rooms side by side; "s" is the shared wall at x = 4.
std::vector<WallInput> twoRooms() {
    return {
        wall("a", 0.0, 0.0, 4.0, 0.0),
        wall("b", 4.0, 0.0, 8.0, 0.0),
        wall("c", 8.0, 0.0, 8.0, 3.0),
        wall("d", 8.0, 3.0, 4.0, 3.0),
        wall("e", 4.0, 3.0, 0.0, 3.0),
        wall("f", 0.0, 3.0, 0.0, 0.0),
        wall("s", 4.0, 0.0, 4.0, 3.0)
    };
}

std::set<WallID> idSet(const DetectedRoom& room) {
    return {room.wallIds.begin(), room.wallIds.end()};
}

std::string joinIds(const std::vector<WallID>& ids) {
    std::string out;
    for (const auto& id : ids) {
        if (!out.empty()) {
            out += ",";
        }
        out += id;
    }
    return out;
}

std::string joinIds(const std::set<WallID>& ids) {
    return joinIds(std::vector<WallID>(ids.begin(), ids.end()));
}

TestResult testRectangleRoom() {
    auto rooms = detectRooms(rectangle(4.0, 3.0));
    if (rooms.size() != 1) {
        return {false, "1 room", std::to_string(rooms.size())};
    }
    const auto& room = rooms.front();
    if (room.polygon.size() != 4) {
        return {false, "4 vertices", std::to_string(room.polygon.size())};
    }
    if (!approx(room.area, 12.0)) {
        return {false, "area 12", std::to_string(room.area)};
    }
    if (idSet(room) != std::set<WallID>{"w1", "w2", "w3", "w4"}) {
        return {false, "w1,w2,w3,w4", joinIds(room.wallIds)};
    }
    return {true, "", ""};
}

TestResult testRoomPolygonIsClockwise() {
    auto rooms = detectRooms(rectangle(2.0, 5.0));
    if (rooms.size() != 1) {
        return {false, "1 room", std::to_string(rooms.size())};
    }
    const auto& polygon = rooms.front().polygon;
    double twiceArea = 0.0;
    for (size_t i = 0; i < polygon.size(); ++i) {
        const auto& p = polygon[i];
        const auto& q = polygon[(i + 1) % polygon.size()];
        twiceArea += p.x * q.y - q.x * p.y;
    }
    if (twiceArea >= 0.0) {
        return {false, "negative signed area", std::to_string(twiceArea * 0.5)};
    }
    if (polygon.front() == polygon.back()) {
        return {false, "open vertex list", "closing vertex repeated"};
    }
    return {true, "", ""};
}

TestResult testTriangleRoom() {
    std::vector<WallInput> walls = {
        wall("t1", 0.0, 0.0, 3.0, 0.0),
        wall("t2", 3.0, 0.0, 0.0, 4.0),
        wall("t3", 0.0, 4.0, 0.0, 0.0)
    };
    auto rooms = detectRooms(walls);
    if (rooms.size() != 1) {
        return {false, "1 room", std::to_string(rooms.size())};
    }
    if (!approx(rooms.front().area, 6.0)) {
        return {false, "area 6", std::to_string(rooms.front().area)};
    }
    return {true, "", ""};
}

TestResult testSingleWallHasNoRoom() {
    RoomDetector detector;
    auto result = detector.detect({wall("only", 0.0, 0.0, 5.0, 0.0)});
    if (!result.rooms.empty()) {
        return {false, "0 rooms", std::to_string(result.rooms.size())};
    }
    if (result.stats.tracedFaces != 1 || result.stats.exteriorFaces != 1) {
        return {false, "1 traced exterior face",
                std::to_string(result.stats.tracedFaces) + " traced, " +
                    std::to_string(result.stats.exteriorFaces) + " exterior"};
    }
    return {true, "", ""};
}

TestResult testEmptyInput() {
    RoomDetector detector;
    auto result = detector.detect(std::vector<WallInput>{});
    if (!result.rooms.empty() || result.stats.nodeCount != 0 || result.stats.tracedFaces != 0) {
        return {false, "empty result", std::to_string(result.rooms.size()) + " rooms"};
    }
    return {true, "", ""};
}

TestResult testTwoAdjacentRooms() {
    auto rooms = detectRooms(twoRooms());
    if (rooms.size() != 2) {
        return {false, "2 rooms", std::to_string(rooms.size())};
    }
    const std::set<WallID> left{"a", "e", "f", "s"};
    const std::set<WallID> right{"b", "c", "d", "s"};
    // Equal areas keep discovery order: the left room is traced first.
    if (idSet(rooms[0]) != left) {
        return {false, joinIds(left), joinIds(idSet(rooms[0]))};
    }
    if (idSet(rooms[1]) != right) {
        return {false, joinIds(right), joinIds(idSet(rooms[1]))};
    }
    if (!approx(rooms[0].area, 12.0) || !approx(rooms[1].area, 12.0)) {
        return {false, "areas 12/12",
                std::to_string(rooms[0].area) + "/" + std::to_string(rooms[1].area)};
    }
    return {true, "", ""};
}

TestResult testWallIdsFollowBoundary() {
    auto rooms = detectRooms(rectangle(4.0, 3.0));
    if (rooms.size() != 1) {
        return {false, "1 room", std::to_string(rooms.size())};
    }
    // Clockwise from the origin: up the left side, along the top, down, back.
    const std::vector<WallID> expected{"w4", "w3", "w2", "w1"};
    if (rooms.front().wallIds != expected) {
        return {false, joinIds(expected), joinIds(rooms.front().wallIds)};
    }
    return {true, "", ""};
}

TestResult testRoomsSortedByArea() {
    std::vector<WallInput> walls = {
        wall("o1", 0.0, 0.0, 10.0, 0.0),
        wall("o2", 10.0, 0.0, 10.0, 10.0),
        wall("o3", 10.0, 10.0, 0.0, 10.0),
        wall("o4", 0.0, 10.0, 0.0, 0.0),
        wall("i1", 4.0, 4.0, 6.0, 4.0),
        wall("i2", 6.0, 4.0, 6.0, 6.0),
        wall("i3", 6.0, 6.0, 4.0, 6.0),
        wall("i4", 4.0, 6.0, 4.0, 4.0)
    };
    auto rooms = detectRooms(walls);
    if (rooms.size() != 2) {
        return {false, "2 rooms", std::to_string(rooms.size())};
    }
    if (!approx(rooms[0].area, 4.0) || !approx(rooms[1].area, 100.0)) {
        return {false, "4 then 100",
                std::to_string(rooms[0].area) + " then " + std::to_string(rooms[1].area)};
    }
    return {true, "", ""};
}

TestResult testIdempotent() {
    RoomDetector detector;
    auto first = detector.detect(twoRooms());
    auto second = detector.detect(twoRooms());
    if (first.rooms.size() != second.rooms.size()) {
        return {false, "same room count",
                std::to_string(first.rooms.size()) + " vs " + std::to_string(second.rooms.size())};
    }
    for (size_t i = 0; i < first.rooms.size(); ++i) {
        const auto& a = first.rooms[i];
        const auto& b = second.rooms[i];
        if (a.wallIds != b.wallIds || a.polygon != b.polygon || a.area != b.area) {
            return {false, "identical room " + std::to_string(i),
                    joinIds(a.wallIds) + " vs " + joinIds(b.wallIds)};
        }
    }
    return {true, "", ""};
}

TestResult testPermutationKeepsMembership() {
    auto walls = twoRooms();
    auto reversed = walls;
    std::reverse(reversed.begin(), reversed.end());
    auto rotated = walls;
    std::rotate(rotated.begin(), rotated.begin() + 3, rotated.end());

    auto signature = [](const std::vector<DetectedRoom>& rooms) {
        std::multiset<std::pair<long long, std::set<WallID>>> out;
        for (const auto& room : rooms) {
            out.insert({std::llround(room.area * 1000.0), idSet(room)});
        }
        return out;
    };

    auto base = signature(detectRooms(walls));
    if (signature(detectRooms(reversed)) != base) {
        return {false, "same rooms for reversed input", "different"};
    }
    if (signature(detectRooms(rotated)) != base) {
        return {false, "same rooms for rotated input", "different"};
    }
    return {true, "", ""};
}

std::vector<WallInput> squareWithGap(double gap) {
    return {
        wall("g1", 0.0, 0.0, 4.0, 0.0),
        wall("g2", 4.0, 0.0, 4.0, 4.0),
        wall("g3", 4.0, 4.0, 0.0, 4.0),
        wall("g4", 0.0, 4.0, 0.0, gap)
    };
}

TestResult testGapWithinEpsilonCloses() {
    auto rooms = detectRooms(squareWithGap(0.04));
    if (rooms.size() != 1) {
        return {false, "1 room", std::to_string(rooms.size())};
    }
    // The merged node keeps the first endpoint's position.
    if (!approx(rooms.front().area, 16.0)) {
        return {false, "area 16", std::to_string(rooms.front().area)};
    }
    return {true, "", ""};
}

TestResult testGapBeyondEpsilonStaysOpen() {
    auto rooms = detectRooms(squareWithGap(0.06));
    if (!rooms.empty()) {
        return {false, "0 rooms", std::to_string(rooms.size())};
    }
    return {true, "", ""};
}

TestResult testCustomMergeEpsilon() {
    RoomDetectorConfig config;
    config.mergeEpsilon = 0.1;
    RoomDetector detector(config);
    auto result = detector.detect(squareWithGap(0.06));
    if (result.rooms.size() != 1) {
        return {false, "1 room with epsilon 0.1", std::to_string(result.rooms.size())};
    }
    return {true, "", ""};
}

TestResult testDanglingWallKeepsArea() {
    auto walls = rectangle(4.0, 3.0);
    walls.push_back(wall("spur", 0.0, 0.0, 1.0, 1.0));
    auto rooms = detectRooms(walls);
    if (rooms.size() != 1) {
        return {false, "1 room", std::to_string(rooms.size())};
    }
    if (!approx(rooms.front().area, 12.0)) {
        return {false, "area 12", std::to_string(rooms.front().area)};
    }
    // The spur bounds the room from inside, so it is part of the boundary.
    if (idSet(rooms.front()) != std::set<WallID>{"spur", "w1", "w2", "w3", "w4"}) {
        return {false, "spur,w1,w2,w3,w4", joinIds(rooms.front().wallIds)};
    }
    return {true, "", ""};
}

TestResult testDegenerateAndDuplicateWallsReported() {
    auto walls = rectangle(4.0, 3.0);
    walls.push_back(wall("zero", 1.0, 1.0, 1.0, 1.0));
    walls.push_back(wall("dup", 4.0, 0.0, 0.0, 0.0));

    RoomDetector detector;
    auto result = detector.detect(walls);
    if (result.stats.degenerateWallIds != std::vector<WallID>{"zero"}) {
        return {false, "zero", joinIds(result.stats.degenerateWallIds)};
    }
    if (result.stats.collapsedWallIds != std::vector<WallID>{"dup"}) {
        return {false, "dup", joinIds(result.stats.collapsedWallIds)};
    }
    if (result.rooms.size() != 1 || !approx(result.rooms.front().area, 12.0)) {
        return {false, "1 room of area 12", std::to_string(result.rooms.size()) + " rooms"};
    }
    if (idSet(result.rooms.front()).count("dup")) {
        return {false, "dup not in room", joinIds(result.rooms.front().wallIds)};
    }
    if (result.stats.nodeCount != 5 || result.stats.edgeCount != 4) {
        return {false, "5 nodes / 4 edges",
                std::to_string(result.stats.nodeCount) + " / " + std::to_string(result.stats.edgeCount)};
    }
    return {true, "", ""};
}

TestResult testIterationCapAbortsFace() {
    RoomDetectorConfig config;
    config.maxTraceSteps = 3;
    RoomDetector capped(config);
    auto result = capped.detect(rectangle(2.0, 2.0));
    if (!result.rooms.empty()) {
        return {false, "0 rooms with cap 3", std::to_string(result.rooms.size())};
    }
    if (result.stats.abortedTraces != 2) {
        return {false, "2 aborted traces", std::to_string(result.stats.abortedTraces)};
    }

    config.maxTraceSteps = 4;
    capped.setConfig(config);
    result = capped.detect(rectangle(2.0, 2.0));
    if (result.rooms.size() != 1) {
        return {false, "1 room with cap 4", std::to_string(result.rooms.size())};
    }
    return {true, "", ""};
}

TestResult testMinRoomAreaFiltersSmallRooms() {
    RoomDetectorConfig config;
    config.minRoomArea = 13.0;
    RoomDetector detector(config);
    auto result = detector.detect(rectangle(4.0, 3.0));
    if (!result.rooms.empty()) {
        return {false, "0 rooms", std::to_string(result.rooms.size())};
    }
    if (result.stats.degenerateFaces != 1) {
        return {false, "1 degenerate face", std::to_string(result.stats.degenerateFaces)};
    }
    return {true, "", ""};
}

TestResult testFindRoomAtPoint() {
    RoomDetector detector;
    auto room = detector.findRoomAtPoint(twoRooms(), {6.0, 1.5});
    if (!room) {
        return {false, "room at (6,1.5)", "none"};
    }
    if (idSet(*room) != std::set<WallID>{"b", "c", "d", "s"}) {
        return {false, "b,c,d,s", joinIds(room->wallIds)};
    }
    if (detector.findRoomAtPoint(twoRooms(), {10.0, 10.0})) {
        return {false, "no room at (10,10)", "room"};
    }
    return {true, "", ""};
}

TestResult testFindRoomPrefersSmallest() {
    std::vector<WallInput> walls = {
        wall("o1", 0.0, 0.0, 10.0, 0.0),
        wall("o2", 10.0, 0.0, 10.0, 10.0),
        wall("o3", 10.0, 10.0, 0.0, 10.0),
        wall("o4", 0.0, 10.0, 0.0, 0.0),
        wall("i1", 4.0, 4.0, 6.0, 4.0),
        wall("i2", 6.0, 4.0, 6.0, 6.0),
        wall("i3", 6.0, 6.0, 4.0, 6.0),
        wall("i4", 4.0, 6.0, 4.0, 4.0)
    };
    RoomDetector detector;
    auto room = detector.findRoomAtPoint(walls, {5.0, 5.0});
    if (!room || !approx(room->area, 4.0)) {
        return {false, "inner room", room ? std::to_string(room->area) : "none"};
    }
    return {true, "", ""};
}

TestResult testCanonicalFaceKey() {
    if (canonicalFaceKey({3, 1, 2}) != "1,2,3") {
        return {false, "1,2,3", canonicalFaceKey({3, 1, 2})};
    }
    if (canonicalFaceKey({2, 3, 1}) != "1,2,3") {
        return {false, "1,2,3", canonicalFaceKey({2, 3, 1})};
    }
    if (canonicalFaceKey({1, 3, 2}) != "1,3,2") {
        return {false, "1,3,2", canonicalFaceKey({1, 3, 2})};
    }
    if (canonicalFaceKey({4, 0, 3, 0}) != "0,3,0,4") {
        return {false, "0,3,0,4", canonicalFaceKey({4, 0, 3, 0})};
    }
    return {true, "", ""};
}

} // namespace

int main() {
    const std::vector<std::pair<std::string, std::function<TestResult()>>> tests = {
        {"test_rectangle_room", testRectangleRoom},
        {"test_room_polygon_is_clockwise", testRoomPolygonIsClockwise},
        {"test_triangle_room", testTriangleRoom},
        {"test_single_wall_has_no_room", testSingleWallHasNoRoom},
        {"test_empty_input", testEmptyInput},
        {"test_two_adjacent_rooms", testTwoAdjacentRooms},
        {"test_wall_ids_follow_boundary", testWallIdsFollowBoundary},
        {"test_rooms_sorted_by_area", testRoomsSortedByArea},
        {"test_idempotent", testIdempotent},
        {"test_permutation_keeps_membership", testPermutationKeepsMembership},
        {"test_gap_within_epsilon_closes", testGapWithinEpsilonCloses},
        {"test_gap_beyond_epsilon_stays_open", testGapBeyondEpsilonStaysOpen},
        {"test_custom_merge_epsilon", testCustomMergeEpsilon},
        {"test_dangling_wall_keeps_area", testDanglingWallKeepsArea},
        {"test_degenerate_and_duplicate_walls_reported", testDegenerateAndDuplicateWallsReported},
        {"test_iteration_cap_aborts_face", testIterationCapAbortsFace},
        {"test_min_room_area_filters_small_rooms", testMinRoomAreaFiltersSmallRooms},
        {"test_find_room_at_point", testFindRoomAtPoint},
        {"test_find_room_prefers_smallest", testFindRoomPrefersSmallest},
        {"test_canonical_face_key", testCanonicalFaceKey}
    };

    int passed = 0;
    int total = 0;
    for (const auto& [name, fn] : tests) {
        ++total;
        TestResult r = fn();
        if (r.pass) {
            ++passed;
            std::cout << "PASS: " << name << std::endl;
        } else {
            std::cout << "FAIL: " << name
                      << " (expected " << r.expected
                      << ", got " << r.got << ")" << std::endl;
        }
    }

    std::cout << passed << "/" << total << " tests passed" << std::endl;
    return passed == total ? 0 : 1;
}
