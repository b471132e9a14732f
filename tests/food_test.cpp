#include <gtest/gtest.h>

#include <random>
#include <set>
#include <stdexcept>
#include <utility>

#include "board.h"
#include "food.h"
#include "snake_theme.h"

TEST(FoodTest, StartsOnTheBoard) {
  Board board(32, 24);
  std::mt19937 rng(7);
  for (int i = 0; i < 50; ++i) {
    Food food(board, rng);
    EXPECT_TRUE(board.contains(food.getPosition()));
  }
}

TEST(FoodTest, RelocationStaysOnTheBoard) {
  Board board(5, 3);
  std::mt19937 rng(7);
  Food food(board, rng);
  for (int i = 0; i < 1000; ++i) {
    food.relocatePosition();
    ASSERT_TRUE(board.contains(food.getPosition()));
  }
}

TEST(FoodTest, RelocationReachesEveryCell) {
  Board board(4, 3);
  std::mt19937 rng(2024);
  Food food(board, rng);

  std::set<std::pair<int, int>> seen;
  for (int i = 0; i < 1200; ++i) {
    food.relocatePosition();
    seen.insert({food.getPosition().x, food.getPosition().y});
  }
  EXPECT_EQ(seen.size(), 12u);
}

TEST(FoodTest, PlaceAt) {
  Board board(10, 10);
  std::mt19937 rng(1);
  Food food(board, rng);

  food.placeAt(Cell(9, 0));
  EXPECT_EQ(food.getPosition(), Cell(9, 0));

  EXPECT_THROW(food.placeAt(Cell(10, 0)), std::out_of_range);
  EXPECT_THROW(food.placeAt(Cell(0, -1)), std::out_of_range);
  EXPECT_EQ(food.getPosition(), Cell(9, 0));
}

TEST(FoodTest, DrawsAsOneRedCell) {
  Board board(10, 10);
  std::mt19937 rng(1);
  Food food(board, rng);
  food.placeAt(Cell(4, 4));

  const Drawable& drawable = food;
  ASSERT_EQ(drawable.occupiedCells().size(), 1u);
  EXPECT_EQ(drawable.occupiedCells()[0], Cell(4, 4));
  EXPECT_TRUE(drawable.color() == SnakeTheme::GameColors::FOOD);
}
