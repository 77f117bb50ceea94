#pragma once
#include <vector>

/*
  Every numeric scheduling constant lives here. Defaults:

    learning_steps          1, 10 minutes
    relearning_steps        10 minutes
    graduating_interval     1 day       (Good on the last learning step)
    easy_interval           4 days      (Easy while learning)
    starting_ease           2500 permille, given to a card when it graduates
    minimum_ease            1300
    ease_again_delta        -200        review lapse
    ease_hard_delta         -150
    ease_easy_delta         +150
    hard_multiplier         1.2         interval factor for Hard
    easy_bonus              1.3         extra factor for Easy
    interval_modifier       1.0         applied to every review interval
    lapse_multiplier        0.5         share of the interval kept after a lapse
    minimum_lapse_interval  1 day
    maximum_interval        36500 days
    fuzz_fraction           0.05        +/- share of the interval
    fuzz_min_interval       3 days      no fuzz below this
    leech_threshold         8 lapses    reported, never auto-suspended
    leech_repeat            4           re-report every N lapses after the threshold (0: never)
    rollover_hour           4           study day boundary (UTC hour)
    bury_siblings           true        hide other cards of an answered note for the session
*/
struct SchedulerConfig {
    std::vector<int> learning_steps = { 1, 10 };
    std::vector<int> relearning_steps = { 10 };
    int graduating_interval = 1;
    int easy_interval = 4;

    int starting_ease = 2500;
    int minimum_ease = 1300;
    int ease_again_delta = -200;
    int ease_hard_delta = -150;
    int ease_easy_delta = 150;

    double hard_multiplier = 1.2;
    double easy_bonus = 1.3;
    double interval_modifier = 1.0;
    double lapse_multiplier = 0.5;
    int minimum_lapse_interval = 1;
    int maximum_interval = 36500;

    double fuzz_fraction = 0.05;
    int fuzz_min_interval = 3;

    int leech_threshold = 8;
    int leech_repeat = 4;

    int rollover_hour = 4;
    bool bury_siblings = true;
};
