#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <stdexcept>
#include <vector>

#include "board.h"
#include "snake.h"

constexpr int kGridWidth = 32;
constexpr int kGridHeight = 24;

class SnakeTest : public ::testing::Test {
 protected:
  Board board{kGridWidth, kGridHeight};
  std::mt19937 rng{12345};

  Snake Restore(std::vector<Cell> body, Direction direction) {
    return Snake(board, rng, std::move(body), direction);
  }
};

// Body cells are distinct and each pair of neighbours is one step apart
::testing::AssertionResult BodyIsWellFormed(const Board& board, const Snake& snake) {
  const auto& body = snake.getBody();
  if (body.empty()) return ::testing::AssertionFailure() << "empty body";
  for (size_t i = 0; i < body.size(); ++i) {
    if (!board.contains(body[i]))
      return ::testing::AssertionFailure() << "segment " << i << " off the board";
    if (std::count(body.begin(), body.end(), body[i]) != 1)
      return ::testing::AssertionFailure() << "segment " << i << " duplicated";
    if (i > 0 && !board.areAdjacent(body[i - 1], body[i]))
      return ::testing::AssertionFailure() << "segments " << i - 1 << "," << i
                                           << " not adjacent";
  }
  return ::testing::AssertionSuccess();
}

/* ===== Construction and reset ===== */

TEST_F(SnakeTest, StartsAtCenterHeadingRight) {
  Snake snake(board, rng);
  EXPECT_EQ(snake.getLength(), 1);
  EXPECT_EQ(snake.getGrowthTarget(), 1);
  EXPECT_EQ(snake.getHead(), board.center());
  EXPECT_EQ(snake.getDirection(), Direction::RIGHT);
  EXPECT_FALSE(snake.getPendingDirection().has_value());
  EXPECT_FALSE(snake.getLastRemoved().has_value());
}

TEST_F(SnakeTest, RestoreRejectsBrokenBodies) {
  EXPECT_THROW(Restore({}, Direction::LEFT), std::invalid_argument);
  EXPECT_THROW(Restore({Cell(5, 5), Cell(7, 5)}, Direction::LEFT), std::invalid_argument);
  EXPECT_THROW(Restore({Cell(5, 5), Cell(4, 5), Cell(5, 5)}, Direction::LEFT),
               std::invalid_argument);
  EXPECT_THROW(Restore({Cell(kGridWidth, 5)}, Direction::LEFT), std::invalid_argument);
  // Heading straight back onto the neck, also across the seam
  EXPECT_THROW(Restore({Cell(5, 5), Cell(4, 5), Cell(3, 5), Cell(2, 5)}, Direction::LEFT),
               std::invalid_argument);
  EXPECT_THROW(Restore({Cell(0, 5), Cell(kGridWidth - 1, 5)}, Direction::LEFT),
               std::invalid_argument);
}

TEST_F(SnakeTest, RestoreAcceptsBodyAcrossTheSeam) {
  Snake snake = Restore({Cell(0, 5), Cell(kGridWidth - 1, 5)}, Direction::RIGHT);
  EXPECT_EQ(snake.getLength(), 2);
  EXPECT_EQ(snake.getGrowthTarget(), 2);
}

TEST_F(SnakeTest, ResetReturnsToSingleCellAtCenter) {
  Snake snake = Restore({Cell(3, 3), Cell(3, 4), Cell(3, 5)}, Direction::UP);
  snake.grow();
  snake.bufferDirection(Direction::LEFT);

  snake.reset();

  EXPECT_EQ(snake.getLength(), 1);
  EXPECT_EQ(snake.getGrowthTarget(), 1);
  EXPECT_EQ(snake.getHead(), board.center());
  EXPECT_FALSE(snake.getPendingDirection().has_value());
  EXPECT_FALSE(snake.getLastRemoved().has_value());
}

TEST_F(SnakeTest, ResetPicksEveryStartDirectionEventually) {
  Snake snake(board, rng);
  std::vector<bool> seen(4, false);
  for (int i = 0; i < 200; ++i) {
    snake.reset();
    seen[static_cast<int>(snake.getDirection())] = true;
  }
  EXPECT_TRUE(seen[0] && seen[1] && seen[2] && seen[3]);
}

/* ===== Direction buffer ===== */

TEST_F(SnakeTest, OppositeTurnIsDiscarded) {
  Snake snake(board, rng);
  snake.bufferDirection(Direction::LEFT);
  snake.commitDirection();
  EXPECT_EQ(snake.getDirection(), Direction::RIGHT);
  EXPECT_FALSE(snake.getPendingDirection().has_value());
}

TEST_F(SnakeTest, PerpendicularTurnIsAdopted) {
  Snake snake(board, rng);
  snake.bufferDirection(Direction::UP);
  EXPECT_EQ(snake.getPendingDirection(), Direction::UP);
  EXPECT_EQ(snake.getDirection(), Direction::RIGHT);  // nothing until commit

  snake.commitDirection();
  EXPECT_EQ(snake.getDirection(), Direction::UP);
  EXPECT_FALSE(snake.getPendingDirection().has_value());
}

TEST_F(SnakeTest, SameDirectionIsAdopted) {
  Snake snake(board, rng);
  snake.bufferDirection(Direction::RIGHT);
  snake.commitDirection();
  EXPECT_EQ(snake.getDirection(), Direction::RIGHT);
  EXPECT_FALSE(snake.getPendingDirection().has_value());
}

TEST_F(SnakeTest, LastBufferedDirectionWins) {
  Snake snake(board, rng);
  snake.bufferDirection(Direction::UP);
  snake.bufferDirection(Direction::DOWN);
  snake.commitDirection();
  EXPECT_EQ(snake.getDirection(), Direction::DOWN);
}

TEST_F(SnakeTest, CommitWithoutBufferKeepsDirection) {
  Snake snake(board, rng);
  snake.commitDirection();
  EXPECT_EQ(snake.getDirection(), Direction::RIGHT);
}

/* ===== Movement ===== */

TEST_F(SnakeTest, AdvanceMovesHeadOneCell) {
  Snake snake(board, rng);
  Cell start = snake.getHead();

  MoveResult move = snake.advance();

  EXPECT_FALSE(move.collided);
  EXPECT_EQ(move.head, Cell(start.x + 1, start.y));
  EXPECT_EQ(snake.getHead(), move.head);
  EXPECT_EQ(snake.getLength(), 1);
  EXPECT_EQ(snake.getLastRemoved(), start);
}

TEST_F(SnakeTest, WrapsAroundEveryEdge) {
  struct Case {
    Cell from;
    Direction direction;
    Cell expected;
  };
  const Case cases[] = {
      {Cell(kGridWidth - 1, 5), Direction::RIGHT, Cell(0, 5)},
      {Cell(0, 5), Direction::LEFT, Cell(kGridWidth - 1, 5)},
      {Cell(7, 0), Direction::UP, Cell(7, kGridHeight - 1)},
      {Cell(7, kGridHeight - 1), Direction::DOWN, Cell(7, 0)},
  };

  for (const Case& c : cases) {
    Snake snake = Restore({c.from}, c.direction);
    MoveResult move = snake.advance();
    EXPECT_FALSE(move.collided);
    EXPECT_EQ(move.head, c.expected) << "from (" << c.from.x << "," << c.from.y << ") "
                                     << directionName(c.direction);
  }
}

TEST_F(SnakeTest, GrowthLagsOneTick) {
  Snake snake(board, rng);
  snake.grow();
  EXPECT_EQ(snake.getGrowthTarget(), 2);
  EXPECT_EQ(snake.getLength(), 1);

  snake.advance();
  EXPECT_EQ(snake.getLength(), 2);
  EXPECT_FALSE(snake.getLastRemoved().has_value());

  snake.advance();
  EXPECT_EQ(snake.getLength(), 2);
  EXPECT_TRUE(snake.getLastRemoved().has_value());
}

TEST_F(SnakeTest, SeveralGrowsCatchUpOneCellPerTick) {
  Snake snake(board, rng);
  snake.grow();
  snake.grow();
  snake.grow();

  for (int expected = 2; expected <= 4; ++expected) {
    snake.advance();
    EXPECT_EQ(snake.getLength(), expected);
  }
  snake.advance();
  EXPECT_EQ(snake.getLength(), 4);
}

TEST_F(SnakeTest, TailDropsWhenNotGrowing) {
  Snake snake = Restore({Cell(5, 5), Cell(4, 5), Cell(3, 5)}, Direction::RIGHT);
  snake.advance();
  std::vector<Cell> expected = {Cell(6, 5), Cell(5, 5), Cell(4, 5)};
  EXPECT_EQ(snake.getBody(), expected);
  EXPECT_EQ(snake.getLastRemoved(), Cell(3, 5));
}

/* ===== Self-collision ===== */

TEST_F(SnakeTest, RunningIntoBodyResets) {
  // Hook shape: turning right from the head lands on body[3]
  Snake snake = Restore({Cell(5, 5), Cell(5, 6), Cell(6, 6), Cell(6, 5), Cell(6, 4)},
                        Direction::UP);
  snake.bufferDirection(Direction::RIGHT);
  snake.commitDirection();

  MoveResult move = snake.advance();

  EXPECT_TRUE(move.collided);
  EXPECT_EQ(move.head, board.center());
  EXPECT_EQ(snake.getLength(), 1);
  EXPECT_EQ(snake.getGrowthTarget(), 1);
  EXPECT_EQ(snake.getHead(), board.center());
  EXPECT_FALSE(snake.getPendingDirection().has_value());
}

TEST_F(SnakeTest, TailCellCountsAsOccupied) {
  // The tail would move away this tick, but the check runs before it does
  Snake snake = Restore({Cell(5, 5), Cell(5, 6), Cell(6, 6), Cell(6, 5)}, Direction::RIGHT);
  EXPECT_TRUE(snake.advance().collided);
}

TEST_F(SnakeTest, ShortSnakesNeverCollide) {
  Snake single = Restore({Cell(5, 5)}, Direction::LEFT);
  Snake pair = Restore({Cell(5, 5), Cell(4, 5)}, Direction::RIGHT);

  const Direction turns[] = {Direction::UP, Direction::LEFT, Direction::DOWN, Direction::RIGHT};
  for (int i = 0; i < 100; ++i) {
    single.bufferDirection(turns[i % 4]);
    single.commitDirection();
    pair.bufferDirection(turns[(i / 3) % 4]);
    pair.commitDirection();
    EXPECT_FALSE(single.advance().collided);
    EXPECT_FALSE(pair.advance().collided);
  }
}

TEST_F(SnakeTest, NeckIsNeverACollisionEvenAcrossTheSeam) {
  // Head at x=0 with the neck on the far side of the seam
  Snake snake = Restore({Cell(0, 5), Cell(kGridWidth - 1, 5), Cell(kGridWidth - 2, 5),
                         Cell(kGridWidth - 3, 5)},
                        Direction::RIGHT);
  snake.bufferDirection(Direction::LEFT);
  snake.commitDirection();

  MoveResult move = snake.advance();

  EXPECT_FALSE(move.collided);
  EXPECT_EQ(move.head, Cell(1, 5));
  EXPECT_EQ(snake.getLength(), 4);
  EXPECT_TRUE(BodyIsWellFormed(board, snake));
}

TEST_F(SnakeTest, TurningBackOverManyTicksKeepsBodyDistinct) {
  Snake snake = Restore({Cell(5, 5), Cell(4, 5), Cell(3, 5), Cell(2, 5)}, Direction::RIGHT);
  for (int i = 0; i < 10; ++i) {
    snake.bufferDirection(opposite(snake.getDirection()));
    snake.commitDirection();
    EXPECT_FALSE(snake.advance().collided);
    ASSERT_TRUE(BodyIsWellFormed(board, snake)) << "tick " << i;
  }
}

/* ===== Long random game ===== */

TEST_F(SnakeTest, InvariantsHoldOverLongRandomGame) {
  Snake snake(board, rng);
  std::mt19937 input(99);
  std::uniform_int_distribution<int> pickDirection(0, 3);
  std::uniform_int_distribution<int> pickGrow(0, 4);

  int resets = 0;
  for (int tick = 0; tick < 5000; ++tick) {
    snake.bufferDirection(static_cast<Direction>(pickDirection(input)));
    snake.commitDirection();

    Cell previousHead = snake.getHead();
    int previousTarget = snake.getGrowthTarget();

    MoveResult move = snake.advance();
    if (move.collided) {
      ++resets;
      EXPECT_EQ(snake.getLength(), 1);
      EXPECT_EQ(snake.getHead(), board.center());
    } else {
      EXPECT_TRUE(board.areAdjacent(previousHead, move.head)) << "tick " << tick;
      EXPECT_EQ(snake.getGrowthTarget(), previousTarget);
      ASSERT_TRUE(BodyIsWellFormed(board, snake)) << "tick " << tick;
    }
    EXPECT_LE(snake.getLength(), snake.getGrowthTarget());

    if (pickGrow(input) == 0) {
      int before = snake.getGrowthTarget();
      snake.grow();
      EXPECT_EQ(snake.getGrowthTarget(), before + 1);
    }
  }
  EXPECT_GT(resets, 0);
}
