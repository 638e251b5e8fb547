#ifndef FXVOL_RETRYPOLICY_H
#define FXVOL_RETRYPOLICY_H

/**
 * Host-supplied configuration for the resilience layer. Durations in milliseconds.
 */

struct RetryPolicy {
    int maxRetries = 3;              // total attempts, including the first
    long long initialDelayMs = 1000;
    long long maxDelayMs = 10000;
    double backoffMultiplier = 2.0;
    long long timeoutMs = 30000;     // per attempt
};

struct CircuitBreakerConfig {
    int failureThreshold = 5;        // consecutive failures before opening
    long long cooldownMs = 60000;    // open -> half-open
};

// Batch-level attempts first, then each member of a failed batch on its own
struct BatchRecoveryOptions {
    RetryPolicy batchPolicy {2, 500, 10000, 2.0, 30000};
    RetryPolicy itemPolicy {1, 200, 10000, 2.0, 30000};
};

struct HealthCheckOptions {
    RetryPolicy checkPolicy {2, 1000, 10000, 2.0, 5000};
    RetryPolicy recheckPolicy {1, 1000, 10000, 2.0, 5000};
};

#endif //FXVOL_RETRYPOLICY_H
