#pragma once
// Logical screen
#define SCREEN_WIDTH 512
#define SCREEN_HEIGHT 256
#define TICK_RATE 30

// Playable arena, top-left corner and size
#define ARENA_X 20.0f
#define ARENA_Y 15.0f
#define ARENA_WIDTH 482.0f
#define ARENA_HEIGHT 221.0f
// Extra room around the arena before the ball is despawned
#define DESPAWN_MARGIN 20.0f

// Paddle movement
#define PADDLE_FRICTION 0.9f
#define PADDLE_IMPULSE 10.0f
#define PADDLE_CONTROL_DELAY 10
#define PADDLE_WIDTH 10.0f
#define PADDLE_HEIGHT 50.0f
#define PADDLE_CLAMP_EPSILON 1.0f
#define PLAYER_START_X 30.0f
#define BOT_START_X 472.0f
#define PADDLE_START_Y 128.0f

// Ball movement
// Not applied to the ball velocity, the ball never slows down.
#define BALL_FRICTION 0.99f
#define BALL_SIZE 10.0f
#define BALL_SPEED 10.0f
#define BALL_BOUNCE_INTERVAL 10
#define BALL_PAD_BOUNCE_INTERVAL 10
#define BALL_SPAWN_RANGE 10.0f
#define BALL_FALLBACK_VEL_X 8.0f
#define BALL_FALLBACK_VEL_Y 9.0f
#define PAD_FALLBACK_DIR_X 8.0f
#define PAD_FALLBACK_DIR_Y 6.0f
#define BALL_LEFT_CLAMP_OFFSET 21.0f

// Goals
#define GOAL_WIDTH 10.0f
#define LEFT_GOAL_X 20.0f
#define RIGHT_GOAL_X 492.0f
#define SCORING_DELAY 10

// Projectiles
#define PROJECTILE_SPEED 8.0f
#define PROJECTILE_WIDTH 6.0f
#define PROJECTILE_HEIGHT 4.0f
#define RELOAD_PERIOD 30
#define STUN_DURATION 45
#define BOT_ENGAGE_RANGE 240.0f

// Tutorial thresholds
#define TUTORIAL_ESCALATE_BOT_SCORE 10
#define TUTORIAL_EASY_PLAYER_SCORE 7
#define TUTORIAL_HARD_BOT_SCORE 7
#define TUTORIAL_EASY_CONTROL_DELAY 2
#define TUTORIAL_SHOOT_TARGET 5

// Score display
#define GLYPH_SCALE 6
#define SCORE_GAP 30.0f
#define SCORE_Y 30.0f

#define WALL_COLOR {255, 255, 255, 255}
#define STUNNED_COLOR {110, 110, 110, 255}
